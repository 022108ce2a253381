// eligian/sema/validator.hpp - Semantic validation of lowered documents
//
#pragma once

#include "eligian/basic/diagnostic.hpp"
#include "eligian/ir/import_graph.hpp"
#include "eligian/ir/ir.hpp"
#include "eligian/registry/registry.hpp"
#include "eligian/sema/operation_catalog.hpp"

namespace eligian
{

/**
 * Collect-all semantic checks over a lowered document.
 *
 * Every rule runs on every input; nothing short-circuits. Each diagnostic
 * carries a stable code and a help message. Output order follows the rule
 * groups (imports, languages, timelines, actions and operations), and
 * source order within a rule.
 *
 * The validator only reads the registry store; it has no state of its own.
 */
class Validator
{
public:
  Validator(
    const ImportGraph & imports, const RegistryStore & registries,
    const OperationCatalog & catalog = OperationCatalog::builtin())
  : imports_(imports), registries_(registries), catalog_(catalog)
  {
  }

  [[nodiscard]] DiagnosticBag validate(const ir::ConfigIR & config) const;

private:
  // Rule groups
  void check_imports(DiagnosticBag & diags) const;
  void check_languages(const ir::ConfigIR & config, DiagnosticBag & diags) const;
  void check_timeline(const ir::Timeline & timeline, DiagnosticBag & diags) const;
  void check_timing(const ir::Timeline & timeline, DiagnosticBag & diags) const;
  void check_operations(
    const ir::ConfigIR & config, const std::vector<ir::Operation> & ops,
    DiagnosticBag & diags) const;

  // Individual checks
  void check_raw_operation(
    const ir::ConfigIR & config, const ir::RawOperation & op, DiagnosticBag & diags) const;
  void check_action_call(
    const ir::ConfigIR & config, const ir::ActionCall & call, DiagnosticBag & diags) const;
  void check_selector(
    const std::string & selector, SourceRange range, DiagnosticBag & diags) const;
  void check_class_name(
    const std::string & class_name, SourceRange range, DiagnosticBag & diags) const;
  void check_label(const std::string & label_id, SourceRange range, DiagnosticBag & diags) const;

  [[nodiscard]] bool has_stylesheets() const;

  const ImportGraph & imports_;
  const RegistryStore & registries_;
  const OperationCatalog & catalog_;
};

/// Validate with the built-in operation catalog
[[nodiscard]] inline DiagnosticBag validate(
  const ir::ConfigIR & config, const ImportGraph & imports, const RegistryStore & registries)
{
  return Validator(imports, registries).validate(config);
}

}  // namespace eligian
