// eligian/codegen/json_emitter.cpp - Eligius configuration JSON output
//
#include "eligian/codegen/json_emitter.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/core.h>

#include "eligian/basic/errors.hpp"

namespace eligian
{

using nlohmann::ordered_json;

namespace
{

void require_finite(double value, const std::string & path)
{
  if (!std::isfinite(value)) {
    throw EmitError(fmt::format("cannot write non-finite number {}", value), path);
  }
}

/// Copy into an ordered value, rejecting non-finite numbers on the way
ordered_json to_ordered(const nlohmann::json & value, const std::string & path)
{
  switch (value.type()) {
    case nlohmann::json::value_t::object: {
      ordered_json out = ordered_json::object();
      for (const auto & item : value.items()) {
        out[item.key()] = to_ordered(item.value(), path + "." + item.key());
      }
      return out;
    }
    case nlohmann::json::value_t::array: {
      ordered_json out = ordered_json::array();
      for (size_t i = 0; i < value.size(); ++i) {
        out.push_back(to_ordered(value[i], fmt::format("{}[{}]", path, i)));
      }
      return out;
    }
    case nlohmann::json::value_t::number_float: {
      const double number = value.get<double>();
      require_finite(number, path);
      return number;
    }
    case nlohmann::json::value_t::number_integer:
      return value.get<int64_t>();
    case nlohmann::json::value_t::number_unsigned:
      return value.get<uint64_t>();
    case nlohmann::json::value_t::string:
      return value.get<std::string>();
    case nlohmann::json::value_t::boolean:
      return value.get<bool>();
    default:
      return nullptr;
  }
}

ordered_json number(double value, const std::string & path)
{
  require_finite(value, path);
  return to_ordered(ir::json_number(value), path);
}

ordered_json operation(std::string id, std::string system_name, ordered_json data)
{
  ordered_json op = ordered_json::object();
  op["id"] = std::move(id);
  op["systemName"] = std::move(system_name);
  op["operationData"] = std::move(data);
  return op;
}

}  // namespace

// ============================================================================
// Document
// ============================================================================

ordered_json JsonEmitter::to_json(const ir::ConfigIR & config) const
{
  ordered_json doc = ordered_json::object();
  doc["$schema"] = k_eligius_schema_url;
  doc["id"] = config.id;
  doc["engine"] = {{"systemName", "Eligius"}};
  doc["containerSelector"] = config.container_selector;
  doc["language"] = config.language;
  doc["layoutTemplate"] =
    config.layout_template ? ordered_json(*config.layout_template) : ordered_json(nullptr);

  ordered_json languages = ordered_json::array();
  for (const auto & lang : config.available_languages) {
    ordered_json entry = ordered_json::object();
    entry["code"] = lang.code;
    entry["label"] = lang.label;
    languages.push_back(std::move(entry));
  }
  doc["availableLanguages"] = std::move(languages);

  doc["labels"] = ordered_json::array();
  doc["initActions"] = ordered_json::array();

  ordered_json actions = ordered_json::array();
  for (size_t i = 0; i < config.actions.size(); ++i) {
    actions.push_back(emit_action(config, config.actions[i], fmt::format("actions[{}]", i)));
  }
  doc["actions"] = std::move(actions);

  doc["eventActions"] = ordered_json::array();

  ordered_json timelines = ordered_json::array();
  for (size_t i = 0; i < config.timelines.size(); ++i) {
    timelines.push_back(
      emit_timeline(config, config.timelines[i], fmt::format("timelines[{}]", i)));
  }
  doc["timelines"] = std::move(timelines);

  return doc;
}

std::string JsonEmitter::emit(const ir::ConfigIR & config, const EmitOptions & options) const
{
  return to_json(config).dump(options.indent > 0 ? options.indent : -1);
}

// ============================================================================
// Actions and timelines
// ============================================================================

ordered_json JsonEmitter::emit_action(
  const ir::ConfigIR & config, const ir::ActionDefinition & action, const std::string & path) const
{
  ordered_json out = ordered_json::object();
  out["id"] = action.id;
  out["name"] = action.name;
  out["startOperations"] = emit_operations(
    config, action.start_operations, false, action.id + "-start", path + ".startOperations");
  out["endOperations"] = emit_operations(
    config, action.end_operations, true, action.id + "-end", path + ".endOperations");
  return out;
}

ordered_json JsonEmitter::emit_timeline(
  const ir::ConfigIR & config, const ir::Timeline & timeline, const std::string & path) const
{
  double duration = 0.0;
  ordered_json actions = ordered_json::array();
  for (size_t i = 0; i < timeline.actions.size(); ++i) {
    const auto & action = timeline.actions[i];
    const std::string action_path = fmt::format("{}.timelineActions[{}]", path, i);

    ordered_json span = ordered_json::object();
    span["start"] = number(action.duration.start, action_path + ".duration.start");
    span["end"] = number(action.duration.end, action_path + ".duration.end");
    duration = std::max(duration, action.duration.end);

    ordered_json out = ordered_json::object();
    out["id"] = action.id;
    out["name"] = action.name;
    out["duration"] = std::move(span);
    out["startOperations"] = emit_operations(
      config, action.operations, false, action.id + "-start", action_path + ".startOperations");
    out["endOperations"] = emit_operations(
      config, action.end_operations, true, action.id + "-end", action_path + ".endOperations");
    actions.push_back(std::move(out));
  }

  ordered_json out = ordered_json::object();
  out["id"] = timeline.id;
  out["uri"] = timeline.source ? ordered_json(*timeline.source) : ordered_json(nullptr);
  out["type"] = std::string(to_string(timeline.provider));
  out["duration"] = number(duration, path + ".duration");
  out["loop"] = timeline.loop;
  out["selector"] = timeline.container_selector;
  out["timelineActions"] = std::move(actions);
  return out;
}

// ============================================================================
// Operations
// ============================================================================

ordered_json JsonEmitter::emit_operations(
  const ir::ConfigIR & config, const std::vector<ir::Operation> & ops, bool end_list,
  const std::string & parent_id, const std::string & path) const
{
  ordered_json out = ordered_json::array();
  size_t counter = 0;
  auto next_id = [&]() { return fmt::format("{}-{}", parent_id, counter++); };

  for (size_t i = 0; i < ops.size(); ++i) {
    const std::string op_path = fmt::format("{}[{}]", path, i);

    if (const auto * raw = std::get_if<ir::RawOperation>(&ops[i])) {
      const OperationSignature * sig = catalog_.find(raw->system_name);
      ordered_json data = ordered_json::object();
      for (size_t a = 0; a < raw->args.size(); ++a) {
        const auto & arg = raw->args[a];
        std::string key;
        if (arg.name) {
          key = *arg.name;
        } else if (const OperationParam * param = sig ? sig->param_at(a) : nullptr) {
          key = std::string(param->name);
        } else {
          key = fmt::format("arg{}", a);
        }
        data[key] = to_ordered(arg.value, op_path + ".operationData." + key);
      }
      out.push_back(operation(next_id(), raw->system_name, std::move(data)));
      continue;
    }

    const auto & call = std::get<ir::ActionCall>(ops[i]);
    const ir::ActionDefinition * action = config.find_action(call.action_name);

    ordered_json action_data = ordered_json::object();
    for (size_t a = 0; a < call.args.size(); ++a) {
      const auto & arg = call.args[a];
      std::string key;
      if (arg.name) {
        key = *arg.name;
      } else if (action && a < action->parameters.size()) {
        key = action->parameters[a].name;
      } else {
        key = fmt::format("arg{}", a);
      }
      action_data[key] =
        to_ordered(arg.value, op_path + ".operationData.actionOperationData." + key);
    }

    out.push_back(operation(next_id(), "requestAction", {{"systemName", call.action_name}}));
    ordered_json data = ordered_json::object();
    data["actionOperationData"] = std::move(action_data);
    out.push_back(operation(next_id(), end_list ? "endAction" : "startAction", std::move(data)));
  }
  return out;
}

}  // namespace eligian
