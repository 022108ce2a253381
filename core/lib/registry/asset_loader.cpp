// eligian/registry/asset_loader.cpp - Filesystem asset access
//
#include "eligian/registry/asset_loader.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace eligian
{

namespace fs = std::filesystem;

std::string uri_to_path(const std::string & uri)
{
  constexpr std::string_view k_file_scheme = "file://";
  if (uri.rfind(k_file_scheme, 0) == 0) {
    return uri.substr(k_file_scheme.size());
  }
  return uri;
}

PathResult resolve_within(const fs::path & base_dir, const std::string & relative)
{
  const fs::path base = base_dir.lexically_normal();
  const fs::path resolved = (base / fs::path(relative)).lexically_normal();

  // Must be base itself or below it
  const fs::path rel = resolved.lexically_relative(base);
  if (rel.empty() || *rel.begin() == "..") {
    return PathResult::fail(
      "path traversal detected: " + resolved.generic_string() + " is outside " +
      base.generic_string());
  }
  return PathResult::ok(resolved.generic_string());
}

bool FileSystemAssetLoader::file_exists(const std::string & path) const
{
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

FileLoadResult FileSystemAssetLoader::load_file(const std::string & path) const
{
  if (!file_exists(path)) {
    return FileLoadResult::fail("file not found: " + path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return FileLoadResult::fail("cannot open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return FileLoadResult::fail("failed to read file: " + path);
  }
  return FileLoadResult::ok(buffer.str());
}

PathResult FileSystemAssetLoader::resolve_path(
  const std::string & source_file, const std::string & relative) const
{
  const fs::path source(uri_to_path(source_file));
  fs::path base = source.parent_path();
  if (base.empty()) {
    base = ".";
  }
  std::error_code ec;
  const fs::path absolute_base = fs::absolute(base, ec);
  return resolve_within(ec ? base : absolute_base, relative);
}

}  // namespace eligian
