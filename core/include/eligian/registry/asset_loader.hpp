// eligian/registry/asset_loader.hpp - Access to imported asset files
//
#pragma once

#include <filesystem>
#include <string>

namespace eligian
{

// ============================================================================
// Results
// ============================================================================

/**
 * Result of reading a file.
 */
struct FileLoadResult
{
  std::string content;
  bool success = false;
  std::string error;

  static FileLoadResult ok(std::string text)
  {
    FileLoadResult r;
    r.content = std::move(text);
    r.success = true;
    return r;
  }

  static FileLoadResult fail(std::string msg)
  {
    FileLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Result of resolving an import path. A failure is always a security
 * error: the path leaves the importing document's directory.
 */
struct PathResult
{
  std::string path;
  bool success = false;
  std::string error;

  static PathResult ok(std::string resolved)
  {
    PathResult r;
    r.path = std::move(resolved);
    r.success = true;
    return r;
  }

  static PathResult fail(std::string msg)
  {
    PathResult r;
    r.error = std::move(msg);
    return r;
  }
};

// ============================================================================
// AssetLoader
// ============================================================================

/**
 * File access used by the registry loader. Tests substitute an in-memory
 * implementation.
 */
class AssetLoader
{
public:
  virtual ~AssetLoader() = default;

  [[nodiscard]] virtual bool file_exists(const std::string & path) const = 0;

  [[nodiscard]] virtual FileLoadResult load_file(const std::string & path) const = 0;

  /**
   * Resolve `relative` against the directory of `source_file`.
   * Paths that end up outside that directory are rejected.
   */
  [[nodiscard]] virtual PathResult resolve_path(
    const std::string & source_file, const std::string & relative) const = 0;
};

/// Strip a leading "file://" from a document URI
[[nodiscard]] std::string uri_to_path(const std::string & uri);

/**
 * Lexically resolve `relative` against `base_dir` and check it stays inside.
 * Shared by every AssetLoader implementation.
 */
[[nodiscard]] PathResult resolve_within(
  const std::filesystem::path & base_dir, const std::string & relative);

/**
 * AssetLoader over the local filesystem.
 */
class FileSystemAssetLoader : public AssetLoader
{
public:
  FileSystemAssetLoader() = default;

  [[nodiscard]] bool file_exists(const std::string & path) const override;
  [[nodiscard]] FileLoadResult load_file(const std::string & path) const override;
  [[nodiscard]] PathResult resolve_path(
    const std::string & source_file, const std::string & relative) const override;
};

}  // namespace eligian
