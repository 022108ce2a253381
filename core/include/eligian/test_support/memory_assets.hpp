// eligian/test_support/memory_assets.hpp - in-memory AssetLoader for tests
//
#pragma once

#include <filesystem>
#include <map>
#include <string>

#include "eligian/registry/asset_loader.hpp"

namespace eligian::test_support
{

/**
 * AssetLoader over a path -> content map. Paths resolve exactly like the
 * filesystem loader, minus the filesystem.
 */
class MemoryAssetLoader : public AssetLoader
{
public:
  void add(const std::string & path, std::string content) { files_[path] = std::move(content); }

  [[nodiscard]] bool file_exists(const std::string & path) const override
  {
    return files_.count(path) != 0;
  }

  [[nodiscard]] FileLoadResult load_file(const std::string & path) const override
  {
    const auto it = files_.find(path);
    if (it == files_.end()) {
      return FileLoadResult::fail("file not found: " + path);
    }
    return FileLoadResult::ok(it->second);
  }

  [[nodiscard]] PathResult resolve_path(
    const std::string & source_file, const std::string & relative) const override
  {
    return resolve_within(std::filesystem::path(uri_to_path(source_file)).parent_path(), relative);
  }

private:
  std::map<std::string, std::string> files_;
};

}  // namespace eligian::test_support
