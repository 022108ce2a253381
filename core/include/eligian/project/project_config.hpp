// eligian/project/project_config.hpp - Project configuration (eligian.yaml)
//
// Parses and validates eligian.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace eligian
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Syntax tree files (parser output) to compile
  std::vector<std::filesystem::path> entry_points;

  /// Output directory for generated configuration files
  std::filesystem::path output_dir = "dist";

  /// JSON indentation, 0 for compact output
  int indent = 2;

  /// Treat warnings as errors
  bool strict = false;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (eligian.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Directory containing eligian.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

inline constexpr int k_max_indent = 8;

/**
 * Load a project configuration from an eligian.yaml file.
 *
 * @param config_path Path to eligian.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse project configuration text. `project_root` is stored as given.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to eligian.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "eligian.yaml";

}  // namespace eligian
