// eligian/lowering/ast_lowering.cpp - Syntax tree to IR lowering
//
#include "eligian/lowering/ast_lowering.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fmt/core.h>

#include "eligian/basic/casting.hpp"
#include "eligian/basic/errors.hpp"
#include "eligian/sema/time_evaluator.hpp"

namespace eligian
{

using nlohmann::json;

namespace
{

constexpr std::string_view k_default_language = "en-US";
constexpr std::string_view k_default_container = "body";
constexpr std::string_view k_add_controller = "addController";
constexpr std::string_view k_label_controller = "LabelController";

// ============================================================================
// Value folding
// ============================================================================

std::string property_path(std::string_view scope, gsl::span<const std::string_view> properties)
{
  std::string path(scope);
  for (const auto prop : properties) {
    path += '.';
    path += prop;
  }
  return path;
}

std::optional<json> fold_numbers(BinaryOp op, double l, double r)
{
  switch (op) {
    case BinaryOp::Add:
      return ir::json_number(l + r);
    case BinaryOp::Sub:
      return ir::json_number(l - r);
    case BinaryOp::Mul:
      return ir::json_number(l * r);
    case BinaryOp::Div:
      return ir::json_number(l / r);
    case BinaryOp::Mod:
      return ir::json_number(std::fmod(l, r));
    case BinaryOp::Pow:
      return ir::json_number(std::pow(l, r));
    case BinaryOp::Eq:
      return json(l == r);
    case BinaryOp::Ne:
      return json(l != r);
    case BinaryOp::Lt:
      return json(l < r);
    case BinaryOp::Le:
      return json(l <= r);
    case BinaryOp::Gt:
      return json(l > r);
    case BinaryOp::Ge:
      return json(l >= r);
    case BinaryOp::And:
    case BinaryOp::Or:
      break;
  }
  return std::nullopt;
}

std::optional<json> fold_booleans(BinaryOp op, bool l, bool r)
{
  switch (op) {
    case BinaryOp::And:
      return json(l && r);
    case BinaryOp::Or:
      return json(l || r);
    case BinaryOp::Eq:
      return json(l == r);
    case BinaryOp::Ne:
      return json(l != r);
    default:
      break;
  }
  return std::nullopt;
}

/// Constant value of `lhs op rhs`, or the runtime expression string "(lhs op rhs)"
json fold_binary(BinaryOp op, const json & lhs, const json & rhs)
{
  std::optional<json> folded;
  if (lhs.is_number() && rhs.is_number()) {
    folded = fold_numbers(op, lhs.get<double>(), rhs.get<double>());
  } else if (lhs.is_boolean() && rhs.is_boolean()) {
    folded = fold_booleans(op, lhs.get<bool>(), rhs.get<bool>());
  } else if (op == BinaryOp::Add && lhs.is_string() && rhs.is_string()) {
    const auto & l = lhs.get_ref<const std::string &>();
    const auto & r = rhs.get_ref<const std::string &>();
    // Property references stay symbolic
    if (l.rfind('$', 0) != 0 && r.rfind('$', 0) != 0) {
      folded = json(l + r);
    }
  }
  if (folded) {
    return *folded;
  }
  return fmt::format("({} {} {})", lhs.dump(), to_string(op), rhs.dump());
}

json fold_unary(UnaryOp op, const json & operand)
{
  if (op == UnaryOp::Not && operand.is_boolean()) {
    return !operand.get<bool>();
  }
  if (op == UnaryOp::Neg && operand.is_number()) {
    return ir::json_number(-operand.get<double>());
  }
  return fmt::format("({}{})", to_string(op), operand.dump());
}

std::string format_seconds(double seconds)
{
  return fmt::format("{}", seconds);
}

}  // namespace

// ============================================================================
// Document id
// ============================================================================

std::string document_id(std::string_view uri)
{
  uint64_t hash = 14695981039346656037ULL;
  for (const char c : uri) {
    hash ^= static_cast<uint8_t>(c);
    hash *= 1099511628211ULL;
  }
  return fmt::format("{:016x}", hash);
}

// ============================================================================
// Program
// ============================================================================

ir::ConfigIR AstLowering::lower(const Program & program)
{
  actions_.clear();
  for (const ActionDecl * decl : program.actions) {
    if (decl == nullptr) {
      throw TransformError("null action declaration", program.get_range());
    }
    actions_.emplace(decl->name, decl);
  }

  ir::ConfigIR config;
  config.document_uri = std::string(program.uri);
  config.id = document_id(program.uri);

  for (const Decl * decl : program.imports) {
    const auto * def = dyn_cast<DefaultImportDecl>(decl);
    if (def && def->category == ImportCategory::Layout && !config.layout_template) {
      config.layout_template = std::string(def->path);
    }
  }

  if (program.languages != nullptr) {
    for (const LanguageEntry * entry : program.languages->entries) {
      config.available_languages.push_back(
        {std::string(entry->code), std::string(entry->label), entry->isDefault,
         entry->get_range()});
    }
  }
  // Default entry, else first entry, else en-US
  const auto def_lang = std::find_if(
    config.available_languages.begin(), config.available_languages.end(),
    [](const auto & l) { return l.is_default; });
  if (def_lang != config.available_languages.end()) {
    config.language = def_lang->code;
  } else if (!config.available_languages.empty()) {
    config.language = config.available_languages.front().code;
  } else {
    config.language = std::string(k_default_language);
  }

  for (size_t i = 0; i < program.actions.size(); ++i) {
    config.actions.push_back(lower_action(*program.actions[i], i));
  }

  for (size_t i = 0; i < program.timelines.size(); ++i) {
    const TimelineDecl * decl = program.timelines[i];
    if (decl == nullptr) {
      throw TransformError("null timeline declaration", program.get_range());
    }
    config.timelines.push_back(lower_timeline(*decl, i));
  }

  config.container_selector = config.timelines.empty()
                                ? std::string(k_default_container)
                                : config.timelines.front().container_selector;
  return config;
}

// ============================================================================
// Declarations
// ============================================================================

ir::ActionDefinition AstLowering::lower_action(const ActionDecl & decl, size_t index)
{
  ir::ActionDefinition def;
  def.id = fmt::format("action-{}-{}", index, decl.name);
  def.name = std::string(decl.name);
  def.endable = decl.endable;
  def.range = decl.get_range();

  for (const ParamDecl * param : decl.params) {
    ir::ActionParameter p;
    p.name = std::string(param->name);
    if (param->typeName) p.type_name = std::string(*param->typeName);
    def.parameters.push_back(std::move(p));
  }

  currentAction_ = &decl;
  def.start_operations = lower_ops(decl.startOps);
  def.end_operations = lower_ops(decl.endOps);
  currentAction_ = nullptr;
  return def;
}

ir::Timeline AstLowering::lower_timeline(const TimelineDecl & decl, size_t index)
{
  ir::Timeline timeline;
  timeline.id = fmt::format("timeline-{}-{}", index, decl.name);
  timeline.name = std::string(decl.name);
  timeline.provider = decl.provider;
  timeline.container_selector = std::string(decl.container);
  if (decl.source) timeline.source = std::string(*decl.source);
  timeline.loop = decl.loop;
  timeline.range = decl.get_range();

  // End of the previous action; relative times and blocks start here
  double cursor = 0.0;

  for (const Event * event : decl.events) {
    if (event == nullptr) {
      throw TransformError("null timeline event", decl.get_range());
    }
    if (const auto * timed = dyn_cast<TimedEvent>(event)) {
      lower_timed(*timed, timeline, cursor);
    } else if (const auto * seq = dyn_cast<SequenceBlock>(event)) {
      lower_sequence(*seq, timeline, cursor);
    } else if (const auto * st = dyn_cast<StaggerBlock>(event)) {
      lower_stagger(*st, timeline, cursor);
    } else {
      throw TransformError("unsupported timeline event", event->get_range());
    }
  }

  return timeline;
}

ir::TimelineAction & AstLowering::add_action(ir::Timeline & timeline, ir::ActionOrigin origin)
{
  auto & action = timeline.actions.emplace_back();
  action.id = fmt::format("{}-action-{}", timeline.id, timeline.actions.size() - 1);
  action.origin = origin;
  return action;
}

// ============================================================================
// Timeline events
// ============================================================================

void AstLowering::lower_timed(const TimedEvent & ev, ir::Timeline & timeline, double & cursor)
{
  const TimeEvaluator eval(cursor);
  const double start = eval.evaluate(ev.start);

  auto & action = add_action(timeline, ir::ActionOrigin::Timed);
  action.range = ev.get_range();
  action.duration.start = start;
  if (ev.duration != nullptr) {
    const double length = eval.evaluate(ev.duration);
    action.declared_duration = length;
    action.duration.end = start + length;
  } else if (ev.end != nullptr) {
    action.duration.end = eval.evaluate(ev.end);
  } else {
    throw TransformError("timed event has neither an end time nor a duration", ev.get_range());
  }

  if (ev.call != nullptr) {
    action.name = std::string(ev.call->name);
    lower_call(*ev.call, action.operations);
    // Endable actions are ended when the interval closes
    const auto target = actions_.find(ev.call->name);
    if (target != actions_.end() && target->second->endable && !action.operations.empty()) {
      const auto & last = action.operations.back();
      if (const auto * call = std::get_if<ir::ActionCall>(&last)) {
        action.end_operations.push_back(*call);
      }
    }
  } else {
    action.name = fmt::format(
      "timeline-action-{}-{}", format_seconds(action.duration.start),
      format_seconds(action.duration.end));
    action.operations = lower_ops(ev.startOps);
    action.end_operations = lower_ops(ev.endOps);
  }

  cursor = action.duration.end;
}

void AstLowering::lower_sequence(const SequenceBlock & seq, ir::Timeline & timeline, double & cursor)
{
  for (const SequenceItem * item : seq.items) {
    if (item == nullptr || item->call == nullptr) {
      throw TransformError("sequence step without a call", seq.get_range());
    }
    const double length = TimeEvaluator(cursor).evaluate(item->duration);

    auto & action = add_action(timeline, ir::ActionOrigin::SequenceStep);
    action.name = std::string(item->call->name);
    action.range = item->get_range();
    action.duration = {cursor, cursor + length};
    action.declared_duration = length;
    lower_call(*item->call, action.operations);

    cursor = action.duration.end;
  }
}

void AstLowering::lower_stagger(const StaggerBlock & st, ir::Timeline & timeline, double & cursor)
{
  const TimeEvaluator eval(cursor);
  const double delay = eval.evaluate(st.delay);
  const double length = eval.evaluate(st.duration);
  if (st.items == nullptr) {
    throw TransformError("stagger block without items", st.get_range());
  }
  if (st.call == nullptr && st.startOps.empty() && st.endOps.empty()) {
    throw TransformError("stagger block without a call or operations", st.get_range());
  }

  // An array literal staggers its elements, anything else is a single item
  std::vector<json> items;
  if (const auto * array = dyn_cast<ArrayLiteralExpr>(st.items)) {
    for (const Expr * element : array->elements) {
      items.push_back(lower_expr(element));
    }
  } else {
    items.push_back(lower_expr(st.items));
  }

  const size_t group = timeline.stagger_groups.size();
  timeline.stagger_groups.push_back({delay, length, items.size(), st.get_range()});

  const double base = cursor;
  for (size_t i = 0; i < items.size(); ++i) {
    auto & action = add_action(timeline, ir::ActionOrigin::StaggerItem);
    action.range = st.get_range();
    action.stagger_group = group;
    action.declared_duration = length;
    action.duration.start = base + static_cast<double>(i) * delay;
    action.duration.end = action.duration.start + length;

    if (st.call != nullptr) {
      action.name = fmt::format("{}-{}", st.call->name, i);
      lower_call(*st.call, action.operations, &items[i]);
    } else {
      action.name = fmt::format("stagger-item-{}", i);
      action.operations = lower_ops(st.startOps);
      action.end_operations = lower_ops(st.endOps);
    }

    cursor = action.duration.end;
  }
}

// ============================================================================
// Operations
// ============================================================================

std::vector<ir::Operation> AstLowering::lower_ops(gsl::span<OperationCall * const> calls)
{
  std::vector<ir::Operation> out;
  for (const OperationCall * call : calls) {
    if (call == nullptr) {
      throw TransformError("null operation call");
    }
    lower_call(*call, out);
  }
  return out;
}

void AstLowering::lower_call(
  const OperationCall & call, std::vector<ir::Operation> & out, const json * leading_arg)
{
  if (call.name == k_add_controller) {
    lower_add_controller(call, out);
    return;
  }

  std::vector<ir::Argument> args;
  if (leading_arg != nullptr) {
    args.push_back({std::nullopt, *leading_arg, call.get_range()});
  }
  for (auto & arg : lower_args(call.args)) {
    args.push_back(std::move(arg));
  }

  if (actions_.count(call.name) != 0) {
    out.emplace_back(ir::ActionCall{std::string(call.name), std::move(args), call.get_range()});
  } else {
    out.emplace_back(ir::RawOperation{std::string(call.name), std::move(args), call.get_range()});
  }
}

void AstLowering::lower_add_controller(const OperationCall & call, std::vector<ir::Operation> & out)
{
  if (call.args.empty() || call.args.size() > 2) {
    throw TransformError(
      fmt::format("addController takes a controller name and an optional argument, got {} argument(s)",
                  call.args.size()),
      call.get_range());
  }

  const json name = lower_expr(call.args[0]->value);
  if (!name.is_string()) {
    throw TransformError("addController: controller name must be a string", call.args[0]->get_range());
  }
  const auto & controller = name.get_ref<const std::string &>();

  std::vector<ir::Argument> instance_args;
  instance_args.push_back({std::string("systemName"), name, call.args[0]->get_range()});
  out.emplace_back(
    ir::RawOperation{"getControllerInstance", std::move(instance_args), call.get_range()});

  std::vector<ir::Argument> data;
  if (call.args.size() == 2) {
    const Argument * arg = call.args[1];
    json value = lower_expr(arg->value);
    if (controller == k_label_controller) {
      data.push_back({std::string("labelId"), std::move(value), arg->get_range()});
    } else if (value.is_object()) {
      data.push_back({std::string("json"), std::move(value), arg->get_range()});
    } else {
      throw TransformError(
        fmt::format("addController: argument for '{}' must be an object", controller),
        arg->get_range());
    }
  }
  out.emplace_back(
    ir::RawOperation{"addControllerToElement", std::move(data), call.get_range()});
}

std::vector<ir::Argument> AstLowering::lower_args(gsl::span<Argument * const> args)
{
  std::vector<ir::Argument> out;
  out.reserve(args.size());
  for (const Argument * arg : args) {
    if (arg == nullptr) {
      throw TransformError("null argument");
    }
    ir::Argument lowered;
    if (arg->name) lowered.name = std::string(*arg->name);
    lowered.value = lower_expr(arg->value);
    lowered.range = arg->get_range();
    out.push_back(std::move(lowered));
  }
  return out;
}

// ============================================================================
// Expressions
// ============================================================================

json AstLowering::lower_expr(const Expr * expr)
{
  if (expr == nullptr) {
    throw TransformError("missing expression");
  }

  switch (expr->get_kind()) {
    case NodeKind::StringLiteral:
      return std::string(cast<StringLiteralExpr>(expr)->value);

    case NodeKind::NumberLiteral:
      return ir::json_number(cast<NumberLiteralExpr>(expr)->value);

    case NodeKind::BoolLiteral:
      return cast<BoolLiteralExpr>(expr)->value;

    case NodeKind::NullLiteral:
      return nullptr;

    case NodeKind::ObjectLiteral: {
      json obj = json::object();
      for (const ObjectProperty * prop : cast<ObjectLiteralExpr>(expr)->properties) {
        obj[std::string(prop->key)] = lower_expr(prop->value);
      }
      return obj;
    }

    case NodeKind::ArrayLiteral: {
      json arr = json::array();
      for (const Expr * element : cast<ArrayLiteralExpr>(expr)->elements) {
        arr.push_back(lower_expr(element));
      }
      return arr;
    }

    case NodeKind::PropertyRef: {
      const auto * ref = cast<PropertyRefExpr>(expr);
      return property_path(ref->scope, ref->properties);
    }

    case NodeKind::ParamRef: {
      const auto * ref = cast<ParamRefExpr>(expr);
      if (currentAction_ != nullptr) {
        for (const ParamDecl * param : currentAction_->params) {
          if (param->name == ref->name) {
            return fmt::format("$operationdata.{}", ref->name);
          }
        }
        throw TransformError(
          fmt::format("'{}' is not a parameter of action '{}'", ref->name, currentAction_->name),
          ref->get_range());
      }
      throw TransformError(
        fmt::format("parameter reference '{}' outside of an action", ref->name), ref->get_range());
    }

    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(expr);
      return fold_binary(bin->op, lower_expr(bin->lhs), lower_expr(bin->rhs));
    }

    case NodeKind::UnaryExpr: {
      const auto * un = cast<UnaryExpr>(expr);
      return fold_unary(un->op, lower_expr(un->operand));
    }

    default:
      break;
  }

  throw TransformError(
    fmt::format("unsupported expression '{}'", node_kind_tag(expr->get_kind())),
    expr->get_range());
}

}  // namespace eligian
