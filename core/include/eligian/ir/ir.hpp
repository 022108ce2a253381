// eligian/ir/ir.hpp - Intermediate representation of an Eligius configuration
//
// The IR is a plain value tree. Lowering builds it, the validator reads it,
// the optimizer returns a filtered copy and the emitter serializes it.
// Nothing in the IR points back into the syntax tree except source ranges.
//
#pragma once

#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "eligian/ast/ast_enums.hpp"
#include "eligian/basic/source_manager.hpp"

namespace eligian::ir
{

// ============================================================================
// Timing
// ============================================================================

/// Interval in seconds. Validity (start >= 0, end > start) is checked by the validator.
struct Duration
{
  double start = 0.0;
  double end = 0.0;
};

/**
 * JSON value for a number. Integral values are stored as integers so that
 * `500` is written as `500`, not `500.0`. Non-finite values stay doubles.
 */
[[nodiscard]] inline nlohmann::json json_number(double value)
{
  constexpr double k_int_limit = 9007199254740992.0;  // 2^53
  if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= k_int_limit) {
    return static_cast<int64_t>(value);
  }
  return value;
}

// ============================================================================
// Operations
// ============================================================================

/// Evaluated call argument. `name` is set for keyword arguments.
struct Argument
{
  std::optional<std::string> name;
  nlohmann::json value;
  SourceRange range;
};

/// Call of a built-in Eligius operation.
struct RawOperation
{
  std::string system_name;
  std::vector<Argument> args;
  SourceRange range;
};

/// Call of an action declared in the same document.
struct ActionCall
{
  std::string action_name;
  std::vector<Argument> args;
  SourceRange range;
};

using Operation = std::variant<RawOperation, ActionCall>;

[[nodiscard]] inline SourceRange operation_range(const Operation & op)
{
  return std::visit([](const auto & o) { return o.range; }, op);
}

// ============================================================================
// Timelines
// ============================================================================

/// Construct a timeline action was lowered from.
enum class ActionOrigin : uint8_t {
  Timed,         ///< at T1..T2 / at T for D
  SequenceStep,  ///< step of a sequence block
  StaggerItem,   ///< item of a stagger block
};

[[nodiscard]] constexpr std::string_view to_string(ActionOrigin origin) noexcept
{
  switch (origin) {
    case ActionOrigin::Timed:
      return "timed";
    case ActionOrigin::SequenceStep:
      return "sequence";
    case ActionOrigin::StaggerItem:
      return "stagger";
  }
  return "";
}

struct TimelineAction
{
  std::string id;
  std::string name;
  Duration duration;
  std::vector<Operation> operations;
  std::vector<Operation> end_operations;

  ActionOrigin origin = ActionOrigin::Timed;
  /// Evaluated `for D` / sequence step duration, when one was written
  std::optional<double> declared_duration;
  /// Index into Timeline::stagger_groups for stagger items
  std::optional<size_t> stagger_group;

  SourceRange range;
};

/// One stagger block, shared by the actions it produced.
struct StaggerGroup
{
  double delay = 0.0;
  double duration = 0.0;
  size_t item_count = 0;
  SourceRange range;
};

struct Timeline
{
  std::string id;
  std::string name;
  TimelineProvider provider = TimelineProvider::Raf;
  std::string container_selector;
  std::optional<std::string> source;
  bool loop = false;

  std::vector<TimelineAction> actions;
  std::vector<StaggerGroup> stagger_groups;

  SourceRange range;
};

// ============================================================================
// Declarations
// ============================================================================

struct ActionParameter
{
  std::string name;
  std::optional<std::string> type_name;
};

struct ActionDefinition
{
  std::string id;
  std::string name;
  std::vector<ActionParameter> parameters;
  std::vector<Operation> start_operations;
  std::vector<Operation> end_operations;
  bool endable = false;
  SourceRange range;
};

struct Language
{
  std::string code;
  std::string label;
  bool is_default = false;
  SourceRange range;
};

// ============================================================================
// Configuration Root
// ============================================================================

struct ConfigIR
{
  std::string id;
  std::string document_uri;
  std::string container_selector;
  std::string language = "en-US";
  std::optional<std::string> layout_template;
  std::vector<Language> available_languages;
  std::vector<ActionDefinition> actions;
  std::vector<Timeline> timelines;

  /// Action definition by name, nullptr if none
  [[nodiscard]] const ActionDefinition * find_action(std::string_view name) const noexcept
  {
    for (const auto & action : actions) {
      if (action.name == name) return &action;
    }
    return nullptr;
  }
};

}  // namespace eligian::ir
