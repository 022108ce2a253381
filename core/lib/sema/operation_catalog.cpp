// eligian/sema/operation_catalog.cpp - Built-in operation table
//
#include "eligian/sema/operation_catalog.hpp"

#include <algorithm>

#include "eligian/basic/string_distance.hpp"

namespace eligian
{

std::string_view to_string(ParamType type) noexcept
{
  switch (type) {
    case ParamType::Selector:
      return "selector";
    case ParamType::ClassName:
      return "className";
    case ParamType::LabelId:
      return "labelId";
    case ParamType::String:
      return "string";
    case ParamType::Number:
      return "number";
    case ParamType::Boolean:
      return "boolean";
    case ParamType::Object:
      return "object";
    case ParamType::Array:
      return "array";
    case ParamType::Expression:
      return "expression";
    case ParamType::ActionName:
      return "actionName";
    case ParamType::SystemName:
      return "systemName";
    case ParamType::EventName:
      return "eventName";
    case ParamType::Url:
      return "url";
    case ParamType::HtmlContent:
      return "htmlContent";
  }
  return "";
}

// ============================================================================
// OperationSignature
// ============================================================================

size_t OperationSignature::required_count() const noexcept
{
  return static_cast<size_t>(
    std::count_if(params.begin(), params.end(), [](const auto & p) { return p.required; }));
}

const OperationParam * OperationSignature::find_param(std::string_view param_name) const noexcept
{
  for (const auto & p : params) {
    if (p.name == param_name) return &p;
  }
  return nullptr;
}

std::string OperationSignature::format_usage() const
{
  std::string out(name);
  out += '(';
  bool first = true;
  // Required parameters first, optional ones bracketed
  for (const bool pass_required : {true, false}) {
    for (const auto & p : params) {
      if (p.required != pass_required) continue;
      if (!first) out += ", ";
      first = false;
      if (p.required) {
        out += p.name;
      } else {
        out += '[';
        out += p.name;
        out += ']';
      }
    }
  }
  out += ')';
  return out;
}

// ============================================================================
// Built-in table
// ============================================================================

namespace
{

using P = OperationParam;
using T = ParamType;

const P k_select_element[] = {
  {"selector", T::Selector, true},
  {"useSelectedElementAsRoot", T::Boolean, false},
};
const P k_class_name[] = {{"className", T::ClassName, true}};
const P k_properties[] = {{"properties", T::Object, true}};
const P k_animate[] = {
  {"animationProperties", T::Object, true},
  {"animationDuration", T::Number, true},
  {"animationEasing", T::String, false},
};
const P k_wait[] = {{"milliseconds", T::Number, true}};
const P k_log[] = {{"logValue", T::Expression, false}};
const P k_set_element_content[] = {
  {"template", T::HtmlContent, true},
  {"insertionType", T::String, false},
};
const P k_set_element_attributes[] = {{"attributes", T::Object, true}};
const P k_create_element[] = {
  {"elementName", T::String, true},
  {"text", T::String, false},
  {"attributes", T::Object, false},
};
const P k_system_name[] = {{"systemName", T::SystemName, true}};
const P k_add_controller_to_element[] = {
  {"json", T::Object, false},
  {"labelId", T::LabelId, false},
};
const P k_action_operation_data[] = {{"actionOperationData", T::Object, false}};
const P k_broadcast_event[] = {
  {"eventName", T::EventName, true},
  {"eventArgs", T::Array, false},
  {"eventTopic", T::String, false},
};
const P k_when[] = {{"expression", T::Expression, true}};
const P k_for_each[] = {{"collection", T::Array, true}};
const P k_set_operation_data[] = {
  {"properties", T::Object, true},
  {"override", T::Boolean, false},
};
const P k_load_json[] = {
  {"url", T::Url, true},
  {"cache", T::Boolean, false},
};
const P k_reparent_element[] = {{"newParentSelector", T::Selector, true}};
const P k_start_timeline[] = {{"uri", T::Url, false}};
const P k_set_global_data[] = {{"properties", T::Object, true}};

const OperationSignature k_builtins[] = {
  {"selectElement", "Select an element by CSS selector", k_select_element},
  {"addClass", "Add a CSS class to the selected element", k_class_name},
  {"removeClass", "Remove a CSS class from the selected element", k_class_name},
  {"toggleClass", "Toggle a CSS class on the selected element", k_class_name},
  {"setStyle", "Set inline styles on the selected element", k_properties},
  {"animate", "Animate CSS properties of the selected element", k_animate},
  {"wait", "Pause the operation list", k_wait},
  {"log", "Log a value to the console", k_log},
  {"setData", "Copy properties onto the selected element's data", k_properties},
  {"clearElement", "Remove all children of the selected element", {}},
  {"removeElement", "Remove the selected element from the DOM", {}},
  {"setElementContent", "Set the HTML content of the selected element", k_set_element_content},
  {"setElementAttributes", "Set attributes on the selected element", k_set_element_attributes},
  {"createElement", "Create a new DOM element", k_create_element},
  {"getControllerInstance", "Create a controller instance by system name", k_system_name},
  {"addControllerToElement", "Attach the current controller to the selected element",
   k_add_controller_to_element},
  {"requestAction", "Look up an action by system name", k_system_name},
  {"startAction", "Start the requested action", k_action_operation_data},
  {"endAction", "End the requested action", k_action_operation_data},
  {"broadcastEvent", "Broadcast an event on the event bus", k_broadcast_event},
  {"when", "Begin a conditional block", k_when},
  {"otherwise", "Begin the else branch of a conditional block", {}},
  {"endWhen", "End a conditional block", {}},
  {"forEach", "Begin a loop over a collection", k_for_each},
  {"endForEach", "End a loop", {}},
  {"setOperationData", "Set properties of the operation data", k_set_operation_data},
  {"loadJson", "Load a JSON document into the operation data", k_load_json},
  {"reparentElement", "Move the selected element under another parent", k_reparent_element},
  {"startTimeline", "Start playback of a timeline", k_start_timeline},
  {"setGlobalData", "Store properties in the global data store", k_set_global_data},
};

}  // namespace

// ============================================================================
// OperationCatalog
// ============================================================================

const OperationCatalog & OperationCatalog::builtin()
{
  static const OperationCatalog catalog{gsl::span<const OperationSignature>(k_builtins)};
  return catalog;
}

const OperationSignature * OperationCatalog::find(std::string_view name) const noexcept
{
  for (const auto & sig : signatures_) {
    if (sig.name == name) return &sig;
  }
  return nullptr;
}

std::vector<std::string> OperationCatalog::names() const
{
  std::vector<std::string> out;
  out.reserve(signatures_.size());
  for (const auto & sig : signatures_) {
    out.emplace_back(sig.name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> OperationCatalog::suggest(std::string_view name, size_t max_count) const
{
  return similar_names(name, names(), max_count);
}

}  // namespace eligian
