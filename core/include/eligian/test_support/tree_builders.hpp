// eligian/test_support/tree_builders.hpp - helpers for unit/integration tests
//
// Builders for the parser's JSON syntax tree, plus a one-call lowering
// pipeline. Tests describe documents as trees instead of depending on the
// external parser.
//
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "eligian/ast/ast_context.hpp"
#include "eligian/ast/syntax_tree_provider.hpp"
#include "eligian/ir/import_graph.hpp"
#include "eligian/ir/ir.hpp"
#include "eligian/lowering/ast_lowering.hpp"

namespace eligian::test_support
{

using nlohmann::json;

inline constexpr const char * k_test_uri = "file:///project/presentation.eligian";

// ============================================================================
// Expressions
// ============================================================================

[[nodiscard]] inline json node(const std::string & type, json fields = json::object())
{
  fields["type"] = type;
  return fields;
}

[[nodiscard]] inline json str(const std::string & value)
{
  return node("StringLiteral", {{"value", value}});
}

[[nodiscard]] inline json num(double value) { return node("NumberLiteral", {{"value", value}}); }

[[nodiscard]] inline json boolean(bool value)
{
  return node("BooleanLiteral", {{"value", value}});
}

[[nodiscard]] inline json array(std::vector<json> elements)
{
  return node("ArrayLiteral", {{"elements", std::move(elements)}});
}

[[nodiscard]] inline json object(std::vector<std::pair<std::string, json>> props)
{
  json list = json::array();
  for (auto & [key, value] : props) {
    list.push_back(node("ObjectProperty", {{"key", key}, {"value", std::move(value)}}));
  }
  return node("ObjectLiteral", {{"properties", std::move(list)}});
}

[[nodiscard]] inline json binary(json lhs, const std::string & op, json rhs)
{
  return node("BinaryExpression", {{"left", std::move(lhs)}, {"op", op}, {"right", std::move(rhs)}});
}

[[nodiscard]] inline json param_ref(const std::string & name)
{
  return node("ParameterReference", {{"name", name}});
}

[[nodiscard]] inline json property_ref(const std::string & scope, std::vector<std::string> props)
{
  return node("PropertyChainReference", {{"scope", scope}, {"properties", std::move(props)}});
}

// ============================================================================
// Time
// ============================================================================

[[nodiscard]] inline json t(const std::string & text)
{
  return node("TimeLiteral", {{"text", text}});
}

[[nodiscard]] inline json relative(json offset)
{
  return node("RelativeTimeLiteral", {{"offset", std::move(offset)}});
}

[[nodiscard]] inline json time_op(json lhs, const std::string & op, json rhs)
{
  return node(
    "BinaryTimeExpression", {{"left", std::move(lhs)}, {"op", op}, {"right", std::move(rhs)}});
}

// ============================================================================
// Calls and events
// ============================================================================

[[nodiscard]] inline json kwarg(const std::string & name, json value)
{
  return node("Argument", {{"name", name}, {"value", std::move(value)}});
}

[[nodiscard]] inline json call(const std::string & name, std::vector<json> args = {})
{
  return node("OperationCall", {{"name", name}, {"args", std::move(args)}});
}

/// `at start..end name(args)`
[[nodiscard]] inline json at(json start, json end, json action_call)
{
  return node(
    "TimedEvent", {{"start", std::move(start)}, {"end", std::move(end)}, {"call", std::move(action_call)}});
}

/// `at start..end [start_ops] [end_ops]`
[[nodiscard]] inline json at_ops(
  json start, json end, std::vector<json> start_ops, std::vector<json> end_ops = {})
{
  return node(
    "TimedEvent", {{"start", std::move(start)},
                   {"end", std::move(end)},
                   {"startOps", std::move(start_ops)},
                   {"endOps", std::move(end_ops)}});
}

/// `at start for duration name(args)`
[[nodiscard]] inline json at_for(json start, json duration, json action_call)
{
  return node(
    "TimedEvent",
    {{"start", std::move(start)}, {"duration", std::move(duration)}, {"call", std::move(action_call)}});
}

[[nodiscard]] inline json step(json action_call, json duration)
{
  return node("SequenceItem", {{"call", std::move(action_call)}, {"duration", std::move(duration)}});
}

[[nodiscard]] inline json sequence(std::vector<json> steps)
{
  return node("SequenceBlock", {{"items", std::move(steps)}});
}

[[nodiscard]] inline json stagger(json delay, json items, json duration, json action_call)
{
  return node(
    "StaggerBlock", {{"delay", std::move(delay)},
                     {"items", std::move(items)},
                     {"duration", std::move(duration)},
                     {"call", std::move(action_call)}});
}

// ============================================================================
// Declarations
// ============================================================================

[[nodiscard]] inline json default_import(const std::string & category, const std::string & path)
{
  return node("DefaultImport", {{"category", category}, {"path", path}});
}

[[nodiscard]] inline json named_import(
  const std::string & name, const std::string & path,
  const std::optional<std::string> & asset_type = std::nullopt)
{
  json j = node("NamedImport", {{"name", name}, {"path", path}});
  if (asset_type) j["assetType"] = *asset_type;
  return j;
}

[[nodiscard]] inline json action(
  const std::string & name, std::vector<std::string> params, std::vector<json> start_ops,
  std::vector<json> end_ops = {}, bool endable = false)
{
  json plist = json::array();
  for (const auto & p : params) {
    plist.push_back(node("Parameter", {{"name", p}}));
  }
  return node(
    "ActionDefinition", {{"name", name},
                         {"endable", endable},
                         {"params", std::move(plist)},
                         {"startOps", std::move(start_ops)},
                         {"endOps", std::move(end_ops)}});
}

[[nodiscard]] inline json timeline(
  const std::string & name, const std::string & provider, const std::string & container,
  std::vector<json> events, const std::optional<std::string> & source = std::nullopt)
{
  json j = node(
    "Timeline",
    {{"name", name}, {"provider", provider}, {"container", container}, {"events", std::move(events)}});
  if (source) j["source"] = *source;
  return j;
}

[[nodiscard]] inline json language(const std::string & code, const std::string & label, bool is_default = false)
{
  return node("LanguageEntry", {{"code", code}, {"label", label}, {"isDefault", is_default}});
}

[[nodiscard]] inline json languages(std::vector<json> entries)
{
  return node("LanguagesBlock", {{"entries", std::move(entries)}});
}

/// Program node; add "languages" to the result when needed
[[nodiscard]] inline json program(
  std::vector<json> imports, std::vector<json> actions, std::vector<json> timelines,
  const std::string & uri = k_test_uri)
{
  return node(
    "Program", {{"uri", uri},
                {"imports", std::move(imports)},
                {"actions", std::move(actions)},
                {"timelines", std::move(timelines)}});
}

/// Program with a single raf timeline in "#app"
[[nodiscard]] inline json single_timeline(std::vector<json> events, std::vector<json> imports = {})
{
  return program(std::move(imports), {}, {timeline("main", "raf", "#app", std::move(events))});
}

// ============================================================================
// Pipeline
// ============================================================================

struct LoweredDocument
{
  std::unique_ptr<AstContext> ast;
  const Program * program = nullptr;
  ImportGraph imports;
  ir::ConfigIR config;
};

/// Read and lower a tree. TransformError propagates.
[[nodiscard]] inline LoweredDocument lower_tree(const json & tree)
{
  LoweredDocument out;
  out.ast = std::make_unique<AstContext>();
  out.program = program_from_json(tree, *out.ast);
  out.imports = ImportGraph::from_program(*out.program);
  out.config = lower_program(*out.program);
  return out;
}

}  // namespace eligian::test_support
