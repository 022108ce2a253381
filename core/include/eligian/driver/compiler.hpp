// eligian/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "eligian/ast/syntax_tree_provider.hpp"
#include "eligian/basic/diagnostic.hpp"
#include "eligian/ir/ir.hpp"
#include "eligian/project/project_config.hpp"
#include "eligian/registry/asset_loader.hpp"
#include "eligian/registry/registry.hpp"

namespace eligian
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Lowering and validation only (no output file)
  Build,  ///< Full build including the configuration JSON file
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// JSON indentation, 0 for compact output
  int indent = 2;

  /// Count warnings as errors
  bool strict = false;

  /// Path of the .eligian source; overrides the document URI in the tree.
  /// Imported assets are resolved against its directory.
  std::optional<std::string> source_path;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors; no warnings either in strict mode)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Optimized IR, absent when lowering failed
  std::optional<ir::ConfigIR> ir;

  /// Emitted configuration. Present even with validation errors, in which
  /// case it is provisional.
  std::optional<std::string> json;

  /// Generated files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Syntax tree loading
 * 2. Import collection and registry loading
 * 3. Lowering to IR
 * 4. Validation
 * 5. Optimization
 * 6. JSON emission
 *
 * TransformError and EmitError are reported as TRANSFORM_ERROR and
 * EMIT_ERROR diagnostics; no exception leaves the driver.
 */
class Compiler
{
public:
  /**
   * Compile one document.
   *
   * @param provider Source of the syntax tree
   * @param registries Registry store shared with other compilations
   * @param options Compile options; `mode` and `output_dir` are ignored here
   * @param loader When set, the document's imports are loaded into
   *               `registries` before validation
   */
  [[nodiscard]] static CompileResult compile(
    SyntaxTreeProvider & provider, RegistryStore & registries, const CompileOptions & options,
    const AssetLoader * loader = nullptr);

  /**
   * Compile a syntax tree file, loading its assets from disk.
   *
   * In Build mode a successful compilation writes `<stem>.json` into the
   * output directory (default: next to the tree file).
   */
  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & tree_file, const CompileOptions & options);

  /**
   * Compile every entry point of a project.
   *
   * @param config Project configuration (from eligian.yaml)
   * @param options Compile options (may override config settings)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// Output file name for a tree file: "intro.eligian.json" -> "intro.json"
  [[nodiscard]] static std::filesystem::path output_name(const std::filesystem::path & tree_file);

private:
  static CompileResult compile_file_into(
    const std::filesystem::path & tree_file, const CompileOptions & options,
    const std::filesystem::path & output_dir, RegistryStore & registries);

  static bool write_output(
    const std::string & json, const std::filesystem::path & output_path, DiagnosticBag & diags);

  [[nodiscard]] static bool is_success(const DiagnosticBag & diags, bool strict);
};

}  // namespace eligian
