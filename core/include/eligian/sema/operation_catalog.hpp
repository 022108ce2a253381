// eligian/sema/operation_catalog.hpp - Built-in Eligius operations
//
// Signatures of the operations the Eligius runtime provides. The validator
// checks calls against them and the emitter uses the parameter names to
// build operationData objects.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

namespace eligian
{

/// What an operation parameter holds. Drives the CSS and label checks.
enum class ParamType : uint8_t {
  Selector,
  ClassName,
  LabelId,
  String,
  Number,
  Boolean,
  Object,
  Array,
  Expression,
  ActionName,
  SystemName,
  EventName,
  Url,
  HtmlContent,
};

[[nodiscard]] std::string_view to_string(ParamType type) noexcept;

struct OperationParam
{
  std::string_view name;
  ParamType type;
  bool required = true;
};

struct OperationSignature
{
  std::string_view name;
  std::string_view description;
  gsl::span<const OperationParam> params;

  [[nodiscard]] size_t required_count() const noexcept;
  [[nodiscard]] size_t total_count() const noexcept { return params.size(); }

  /// Parameter at a positional index, nullptr past the end
  [[nodiscard]] const OperationParam * param_at(size_t index) const noexcept
  {
    return index < params.size() ? &params[index] : nullptr;
  }

  /// Parameter by keyword name, nullptr if none
  [[nodiscard]] const OperationParam * find_param(std::string_view name) const noexcept;

  /// "addClass(className)" / "animate(animationProperties, animationDuration, [animationEasing])"
  [[nodiscard]] std::string format_usage() const;
};

/**
 * Read-only table of operation signatures.
 *
 * The table is static; there is one catalog per process.
 *
 * @code
 *   const auto & ops = OperationCatalog::builtin();
 *   if (const auto * sig = ops.find("addClass")) { ... }
 *   ops.suggest("adClass", 3);  // {"addClass"}
 * @endcode
 */
class OperationCatalog
{
public:
  [[nodiscard]] static const OperationCatalog & builtin();

  [[nodiscard]] const OperationSignature * find(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept
  {
    return find(name) != nullptr;
  }

  /// All operation names, sorted
  [[nodiscard]] std::vector<std::string> names() const;

  /// Up to `max_count` names within edit distance 2, closest first
  [[nodiscard]] std::vector<std::string> suggest(std::string_view name, size_t max_count) const;

private:
  explicit OperationCatalog(gsl::span<const OperationSignature> signatures)
  : signatures_(signatures)
  {
  }

  gsl::span<const OperationSignature> signatures_;
};

}  // namespace eligian
