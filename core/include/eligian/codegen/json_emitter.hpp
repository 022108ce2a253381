// eligian/codegen/json_emitter.hpp - Eligius configuration JSON output
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "eligian/ir/ir.hpp"
#include "eligian/sema/operation_catalog.hpp"

namespace eligian
{

inline constexpr const char * k_eligius_schema_url =
  "https://rolandzwaga.github.io/eligius/jsonschema/eligius-configuration.json";

struct EmitOptions
{
  /// Spaces per level; 0 writes compact single-line JSON
  int indent = 2;
};

/**
 * Serializes a ConfigIR into the Eligius configuration schema.
 *
 * Keys are written in schema order (nlohmann::ordered_json) and every id
 * is derived from the IR, so equal input gives byte-identical output.
 *
 * Positional operation arguments are named after the catalog's parameter
 * names; arguments past the signature become `argN`. An action call turns
 * into `requestAction` followed by `startAction` (or `endAction` when it is
 * in an end-operation list).
 *
 * @throws EmitError for a NaN or infinite number anywhere in the IR.
 */
class JsonEmitter
{
public:
  explicit JsonEmitter(const OperationCatalog & catalog = OperationCatalog::builtin())
  : catalog_(catalog)
  {
  }

  [[nodiscard]] nlohmann::ordered_json to_json(const ir::ConfigIR & config) const;
  [[nodiscard]] std::string emit(const ir::ConfigIR & config, const EmitOptions & options) const;

private:
  nlohmann::ordered_json emit_action(
    const ir::ConfigIR & config, const ir::ActionDefinition & action,
    const std::string & path) const;
  nlohmann::ordered_json emit_timeline(
    const ir::ConfigIR & config, const ir::Timeline & timeline, const std::string & path) const;
  nlohmann::ordered_json emit_operations(
    const ir::ConfigIR & config, const std::vector<ir::Operation> & ops, bool end_list,
    const std::string & parent_id, const std::string & path) const;

  const OperationCatalog & catalog_;
};

/// Emit with the built-in catalog
[[nodiscard]] inline std::string emit(const ir::ConfigIR & config, const EmitOptions & options = {})
{
  return JsonEmitter().emit(config, options);
}

}  // namespace eligian
