// eligian/lowering/ast_lowering.hpp - Syntax tree to IR lowering
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "eligian/ast/ast.hpp"
#include "eligian/ir/ir.hpp"

namespace eligian
{

/// Deterministic configuration id for a document URI (FNV-1a, 16 hex digits)
[[nodiscard]] std::string document_id(std::string_view uri);

/**
 * Lowers a syntax tree to ConfigIR.
 *
 * Timing constructs are resolved to absolute intervals:
 * - `at T1..T2` and `at T for D` use the evaluated times directly
 * - `+D` offsets are relative to the end of the previous action
 * - sequence steps start where the previous step ended
 * - stagger item i starts at cursor + i * delay
 *
 * Calls to declared actions become ir::ActionCall, everything else
 * ir::RawOperation; unknown names are left for the validator.
 *
 * Throws TransformError for structurally invalid trees and for
 * non-constant time expressions. Out-of-range times are kept as written so
 * the validator can report them.
 */
class AstLowering
{
public:
  AstLowering() = default;

  [[nodiscard]] ir::ConfigIR lower(const Program & program);

private:
  ir::ActionDefinition lower_action(const ActionDecl & decl, size_t index);
  ir::Timeline lower_timeline(const TimelineDecl & decl, size_t index);

  void lower_timed(const TimedEvent & ev, ir::Timeline & timeline, double & cursor);
  void lower_sequence(const SequenceBlock & seq, ir::Timeline & timeline, double & cursor);
  void lower_stagger(const StaggerBlock & st, ir::Timeline & timeline, double & cursor);

  std::vector<ir::Operation> lower_ops(gsl::span<OperationCall * const> calls);
  void lower_call(
    const OperationCall & call, std::vector<ir::Operation> & out,
    const nlohmann::json * leading_arg = nullptr);
  void lower_add_controller(const OperationCall & call, std::vector<ir::Operation> & out);

  std::vector<ir::Argument> lower_args(gsl::span<Argument * const> args);
  nlohmann::json lower_expr(const Expr * expr);

  ir::TimelineAction & add_action(ir::Timeline & timeline, ir::ActionOrigin origin);

  std::unordered_map<std::string_view, const ActionDecl *> actions_;
  const ActionDecl * currentAction_ = nullptr;
};

/// Convenience wrapper around AstLowering
[[nodiscard]] inline ir::ConfigIR lower_program(const Program & program)
{
  return AstLowering().lower(program);
}

}  // namespace eligian
