// eligian/ast/syntax_tree_provider.cpp - JSON syntax tree reader
//
#include "eligian/ast/syntax_tree_provider.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "eligian/basic/casting.hpp"
#include "eligian/basic/errors.hpp"

namespace eligian
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

SourceRange r_range(const json & j)
{
  const auto it = j.find("range");
  if (it == j.end() || !it->is_object()) {
    return {};
  }
  const auto start = it->find("start");
  const auto end = it->find("end");
  if (start == it->end() || end == it->end()) {
    return {};
  }
  if (!start->is_number_integer() || !end->is_number_integer()) {
    return {};
  }
  if (start->get<int64_t>() < 0 || end->get<int64_t>() < 0) {
    return {};
  }
  return {start->get<uint32_t>(), end->get<uint32_t>()};
}

std::string type_tag(const json & j)
{
  const auto it = j.find("type");
  if (it == j.end() || !it->is_string()) {
    return "<untyped>";
  }
  return it->get<std::string>();
}

NodeKind r_kind(const json & j)
{
  if (!j.is_object()) {
    throw TransformError("syntax tree node must be an object, got " + std::string(j.type_name()));
  }
  const std::string tag = type_tag(j);
  const auto kind = parse_node_kind(tag);
  if (!kind) {
    throw TransformError("unknown syntax tree node type '" + tag + "'", r_range(j));
  }
  return *kind;
}

const json & require(const json & j, const char * field)
{
  const auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    throw TransformError(
      "missing field '" + std::string(field) + "' in " + type_tag(j), r_range(j));
  }
  return *it;
}

const json * optional_field(const json & j, const char * field)
{
  const auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string string_field(const json & j, const char * field)
{
  const json & v = require(j, field);
  if (!v.is_string()) {
    throw TransformError(
      "field '" + std::string(field) + "' in " + type_tag(j) + " must be a string", r_range(j));
  }
  return v.get<std::string>();
}

const json & array_field(const json & j, const char * field)
{
  static const json k_empty = json::array();
  const json * v = optional_field(j, field);
  if (v == nullptr) {
    return k_empty;
  }
  if (!v->is_array()) {
    throw TransformError(
      "field '" + std::string(field) + "' in " + type_tag(j) + " must be an array", r_range(j));
  }
  return *v;
}

// ============================================================================
// TreeReader
// ============================================================================

class TreeReader
{
public:
  explicit TreeReader(AstContext & ctx) : ctx_(ctx) {}

  const Program * program(const json & j);

private:
  std::string_view intern(const std::string & s) { return ctx_.intern(s); }
  std::string_view str(const json & j, const char * field) { return intern(string_field(j, field)); }

  gsl::span<std::string_view> strings(const json & j, const char * field);

  Expr * expr(const json & j);
  TimeExpr * time(const json & j);
  Argument * argument(const json & j);
  OperationCall * call(const json & j);
  gsl::span<OperationCall *> calls(const json & j, const char * field);
  Event * event(const json & j);
  TimedEvent * timed_event(const json & j);
  StaggerBlock * stagger(const json & j);
  Decl * import_decl(const json & j);
  ActionDecl * action(const json & j);
  TimelineDecl * timeline(const json & j);
  LanguagesDecl * languages(const json & j);

  static void expect(const json & j, NodeKind kind)
  {
    if (r_kind(j) != kind) {
      throw TransformError(
        "expected " + std::string(node_kind_tag(kind)) + ", got " + type_tag(j), r_range(j));
    }
  }

  AstContext & ctx_;
};

gsl::span<std::string_view> TreeReader::strings(const json & j, const char * field)
{
  std::vector<std::string_view> out;
  for (const auto & s : array_field(j, field)) {
    if (!s.is_string()) {
      throw TransformError(
        "field '" + std::string(field) + "' in " + type_tag(j) + " must hold strings", r_range(j));
    }
    out.push_back(intern(s.get<std::string>()));
  }
  return ctx_.copy_to_arena(out);
}

Expr * TreeReader::expr(const json & j)
{
  const NodeKind kind = r_kind(j);
  const SourceRange range = r_range(j);

  switch (kind) {
    case NodeKind::StringLiteral:
      return ctx_.create<StringLiteralExpr>(str(j, "value"), range);

    case NodeKind::NumberLiteral: {
      const json & v = require(j, "value");
      if (!v.is_number()) {
        throw TransformError("NumberLiteral value must be a number", range);
      }
      return ctx_.create<NumberLiteralExpr>(v.get<double>(), range);
    }

    case NodeKind::BoolLiteral: {
      const json & v = require(j, "value");
      if (!v.is_boolean()) {
        throw TransformError("BooleanLiteral value must be a boolean", range);
      }
      return ctx_.create<BoolLiteralExpr>(v.get<bool>(), range);
    }

    case NodeKind::NullLiteral:
      return ctx_.create<NullLiteralExpr>(range);

    case NodeKind::ObjectLiteral: {
      std::vector<ObjectProperty *> props;
      for (const auto & p : array_field(j, "properties")) {
        expect(p, NodeKind::ObjectProperty);
        props.push_back(
          ctx_.create<ObjectProperty>(str(p, "key"), expr(require(p, "value")), r_range(p)));
      }
      return ctx_.create<ObjectLiteralExpr>(ctx_.copy_to_arena(props), range);
    }

    case NodeKind::ArrayLiteral: {
      std::vector<Expr *> elems;
      for (const auto & e : array_field(j, "elements")) {
        elems.push_back(expr(e));
      }
      return ctx_.create<ArrayLiteralExpr>(ctx_.copy_to_arena(elems), range);
    }

    case NodeKind::PropertyRef:
      return ctx_.create<PropertyRefExpr>(str(j, "scope"), strings(j, "properties"), range);

    case NodeKind::ParamRef:
      return ctx_.create<ParamRefExpr>(str(j, "name"), range);

    case NodeKind::BinaryExpr: {
      const std::string op_text = string_field(j, "op");
      const auto op = parse_binary_op(op_text);
      if (!op) {
        throw TransformError("unknown binary operator '" + op_text + "'", range);
      }
      return ctx_.create<BinaryExpr>(expr(require(j, "left")), *op, expr(require(j, "right")), range);
    }

    case NodeKind::UnaryExpr: {
      const std::string op_text = string_field(j, "op");
      const auto op = parse_unary_op(op_text);
      if (!op) {
        throw TransformError("unknown unary operator '" + op_text + "'", range);
      }
      return ctx_.create<UnaryExpr>(*op, expr(require(j, "operand")), range);
    }

    default:
      break;
  }

  throw TransformError("expected an expression, got " + type_tag(j), range);
}

TimeExpr * TreeReader::time(const json & j)
{
  const NodeKind kind = r_kind(j);
  const SourceRange range = r_range(j);

  switch (kind) {
    case NodeKind::TimeLiteral:
      return ctx_.create<TimeLiteral>(str(j, "text"), range);

    case NodeKind::RelativeTime:
      return ctx_.create<RelativeTime>(time(require(j, "offset")), range);

    case NodeKind::BinaryTimeExpr: {
      const std::string op_text = string_field(j, "op");
      const auto op = parse_time_op(op_text);
      if (!op) {
        throw TransformError("unknown time operator '" + op_text + "'", range);
      }
      return ctx_.create<BinaryTimeExpr>(
        time(require(j, "left")), *op, time(require(j, "right")), range);
    }

    case NodeKind::TimeRef:
      return ctx_.create<TimeRefExpr>(str(j, "scope"), strings(j, "properties"), range);

    default:
      break;
  }

  throw TransformError("expected a time expression, got " + type_tag(j), range);
}

Argument * TreeReader::argument(const json & j)
{
  // Positional arguments may be written as bare expressions
  if (r_kind(j) != NodeKind::Argument) {
    return ctx_.create<Argument>(expr(j), r_range(j));
  }
  Expr * value = expr(require(j, "value"));
  if (const json * name = optional_field(j, "name")) {
    return ctx_.create<Argument>(intern(name->get<std::string>()), value, r_range(j));
  }
  return ctx_.create<Argument>(value, r_range(j));
}

OperationCall * TreeReader::call(const json & j)
{
  expect(j, NodeKind::OperationCall);
  std::vector<Argument *> args;
  for (const auto & a : array_field(j, "args")) {
    args.push_back(argument(a));
  }
  return ctx_.create<OperationCall>(str(j, "name"), ctx_.copy_to_arena(args), r_range(j));
}

gsl::span<OperationCall *> TreeReader::calls(const json & j, const char * field)
{
  std::vector<OperationCall *> out;
  for (const auto & c : array_field(j, field)) {
    out.push_back(call(c));
  }
  return ctx_.copy_to_arena(out);
}

TimedEvent * TreeReader::timed_event(const json & j)
{
  const SourceRange range = r_range(j);
  auto * ev = ctx_.create<TimedEvent>(time(require(j, "start")), range);

  const json * end = optional_field(j, "end");
  const json * duration = optional_field(j, "duration");
  if ((end == nullptr) == (duration == nullptr)) {
    throw TransformError("TimedEvent needs exactly one of 'end' and 'duration'", range);
  }
  if (end) ev->end = time(*end);
  if (duration) ev->duration = time(*duration);

  if (const json * c = optional_field(j, "call")) {
    ev->call = call(*c);
  } else {
    ev->startOps = calls(j, "startOps");
    ev->endOps = calls(j, "endOps");
  }
  return ev;
}

StaggerBlock * TreeReader::stagger(const json & j)
{
  auto * st = ctx_.create<StaggerBlock>(
    time(require(j, "delay")), expr(require(j, "items")), time(require(j, "duration")),
    r_range(j));
  if (const json * c = optional_field(j, "call")) {
    st->call = call(*c);
  } else {
    st->startOps = calls(j, "startOps");
    st->endOps = calls(j, "endOps");
  }
  return st;
}

Event * TreeReader::event(const json & j)
{
  switch (r_kind(j)) {
    case NodeKind::TimedEvent:
      return timed_event(j);

    case NodeKind::SequenceBlock: {
      std::vector<SequenceItem *> items;
      for (const auto & i : array_field(j, "items")) {
        expect(i, NodeKind::SequenceItem);
        items.push_back(ctx_.create<SequenceItem>(
          call(require(i, "call")), time(require(i, "duration")), r_range(i)));
      }
      return ctx_.create<SequenceBlock>(ctx_.copy_to_arena(items), r_range(j));
    }

    case NodeKind::StaggerBlock:
      return stagger(j);

    default:
      break;
  }
  throw TransformError("expected a timeline event, got " + type_tag(j), r_range(j));
}

Decl * TreeReader::import_decl(const json & j)
{
  const SourceRange range = r_range(j);
  switch (r_kind(j)) {
    case NodeKind::DefaultImport: {
      const std::string category_text = string_field(j, "category");
      const auto category = parse_import_category(category_text);
      if (!category) {
        throw TransformError("unknown default import '" + category_text + "'", range);
      }
      return ctx_.create<DefaultImportDecl>(*category, str(j, "path"), range);
    }

    case NodeKind::NamedImport: {
      auto * imp = ctx_.create<NamedImportDecl>(str(j, "name"), str(j, "path"), range);
      if (const json * t = optional_field(j, "assetType")) {
        const auto type = parse_asset_type(t->get<std::string>());
        if (!type) {
          throw TransformError("unknown asset type '" + t->get<std::string>() + "'", range);
        }
        imp->assetType = type;
      }
      return imp;
    }

    default:
      break;
  }
  throw TransformError("expected an import, got " + type_tag(j), range);
}

ActionDecl * TreeReader::action(const json & j)
{
  expect(j, NodeKind::ActionDecl);
  auto * decl = ctx_.create<ActionDecl>(str(j, "name"), r_range(j));
  if (const json * e = optional_field(j, "endable")) {
    decl->endable = e->get<bool>();
  }

  std::vector<ParamDecl *> params;
  for (const auto & p : array_field(j, "params")) {
    expect(p, NodeKind::ParamDecl);
    auto * param = ctx_.create<ParamDecl>(str(p, "name"), r_range(p));
    if (const json * t = optional_field(p, "paramType")) {
      param->typeName = intern(t->get<std::string>());
    }
    params.push_back(param);
  }
  decl->params = ctx_.copy_to_arena(params);
  decl->startOps = calls(j, "startOps");
  decl->endOps = calls(j, "endOps");
  return decl;
}

TimelineDecl * TreeReader::timeline(const json & j)
{
  expect(j, NodeKind::TimelineDecl);
  const SourceRange range = r_range(j);
  const std::string provider_text = string_field(j, "provider");
  const auto provider = parse_timeline_provider(provider_text);
  if (!provider) {
    throw TransformError("unknown timeline provider '" + provider_text + "'", range);
  }

  auto * decl = ctx_.create<TimelineDecl>(str(j, "name"), *provider, str(j, "container"), range);
  if (const json * s = optional_field(j, "source")) {
    decl->source = intern(s->get<std::string>());
  }
  if (const json * l = optional_field(j, "loop")) {
    decl->loop = l->get<bool>();
  }

  std::vector<Event *> events;
  for (const auto & e : array_field(j, "events")) {
    events.push_back(event(e));
  }
  decl->events = ctx_.copy_to_arena(events);
  return decl;
}

LanguagesDecl * TreeReader::languages(const json & j)
{
  expect(j, NodeKind::LanguagesDecl);
  std::vector<LanguageEntry *> entries;
  for (const auto & e : array_field(j, "entries")) {
    expect(e, NodeKind::LanguageEntry);
    const json * def = optional_field(e, "isDefault");
    entries.push_back(ctx_.create<LanguageEntry>(
      str(e, "code"), str(e, "label"), def != nullptr && def->get<bool>(), r_range(e)));
  }
  return ctx_.create<LanguagesDecl>(ctx_.copy_to_arena(entries), r_range(j));
}

const Program * TreeReader::program(const json & j)
{
  expect(j, NodeKind::Program);
  const json * uri = optional_field(j, "uri");
  auto * prog =
    ctx_.create<Program>(uri ? intern(uri->get<std::string>()) : std::string_view{}, r_range(j));

  std::vector<Decl *> imports;
  for (const auto & i : array_field(j, "imports")) {
    imports.push_back(import_decl(i));
  }
  prog->imports = ctx_.copy_to_arena(imports);

  if (const json * l = optional_field(j, "languages")) {
    prog->languages = languages(*l);
  }

  std::vector<ActionDecl *> actions;
  for (const auto & a : array_field(j, "actions")) {
    actions.push_back(action(a));
  }
  prog->actions = ctx_.copy_to_arena(actions);

  std::vector<TimelineDecl *> timelines;
  for (const auto & t : array_field(j, "timelines")) {
    timelines.push_back(timeline(t));
  }
  prog->timelines = ctx_.copy_to_arena(timelines);

  return prog;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

const Program * program_from_json(const nlohmann::json & tree, AstContext & ctx)
{
  try {
    return TreeReader(ctx).program(tree);
  } catch (const nlohmann::json::exception & e) {
    // Wrong value types inside otherwise well-formed nodes
    throw TransformError(std::string("malformed syntax tree: ") + e.what());
  }
}

JsonSyntaxTreeProvider JsonSyntaxTreeProvider::from_string(const std::string & text)
{
  try {
    return JsonSyntaxTreeProvider(json::parse(text));
  } catch (const json::parse_error & e) {
    throw TransformError(std::string("syntax tree is not valid JSON: ") + e.what());
  }
}

JsonSyntaxTreeProvider JsonSyntaxTreeProvider::from_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    throw TransformError("failed to open syntax tree: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return from_string(buffer.str());
}

const Program * JsonSyntaxTreeProvider::provide(AstContext & ctx)
{
  return program_from_json(tree_, ctx);
}

}  // namespace eligian
