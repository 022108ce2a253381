// eligian/project/project_config.cpp - Project configuration implementation
//
#include "eligian/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace eligian
{

namespace
{

ConfigLoadResult read_config(const YAML::Node & root, ProjectConfig config)
{
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (!pkg.IsMap()) {
      return ConfigLoadResult::fail("package must be a map");
    }
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];
    if (!comp.IsMap()) {
      return ConfigLoadResult::fail("compiler must be a map");
    }

    if (comp["entry_points"]) {
      if (!comp["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.entry_points must be a list");
      }
      for (const auto & ep : comp["entry_points"]) {
        config.compiler.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    if (comp["output_dir"]) {
      config.compiler.output_dir = comp["output_dir"].as<std::string>();
    }

    if (comp["indent"]) {
      config.compiler.indent = comp["indent"].as<int>();
      if (config.compiler.indent < 0 || config.compiler.indent > k_max_indent) {
        return ConfigLoadResult::fail(
          "invalid compiler.indent: " + std::to_string(config.compiler.indent) +
          " (must be between 0 and " + std::to_string(k_max_indent) + ")");
      }
    }

    if (comp["strict"]) {
      config.compiler.strict = comp["strict"].as<bool>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  try {
    return read_config(YAML::Load(text), std::move(config));
  } catch (const YAML::ParserException & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  } catch (const YAML::Exception & e) {
    // Wrong value type, e.g. `indent: wide`
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();
  try {
    return read_config(root, std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace eligian
