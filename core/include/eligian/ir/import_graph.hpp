// eligian/ir/import_graph.hpp - Imports of one document
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "eligian/ast/ast.hpp"

namespace eligian
{

enum class ImportKind : uint8_t { Default, Named };

/// Type a file extension maps to.
enum class ExtensionType : uint8_t { Html, Css, Media, Ambiguous, Unknown };

/// Classify the extension of `path` (case-insensitive). `.ogg` is ambiguous.
[[nodiscard]] ExtensionType classify_extension(std::string_view path);

/// Extension of `path` without the dot, lowercased; empty if there is none
[[nodiscard]] std::string file_extension(std::string_view path);

struct ImportRef
{
  ImportKind kind = ImportKind::Default;
  /// Set for default imports
  std::optional<ImportCategory> category;
  /// Import name for named imports, category keyword for default imports
  std::string name;
  std::string path;
  /// `as html|css|media` on a named import
  std::optional<AssetType> explicit_type;
  SourceRange range;

  /// Explicit type, else the type implied by the extension (if unambiguous)
  [[nodiscard]] std::optional<AssetType> effective_type() const;
};

/**
 * Imports of a document in source order.
 *
 * Built from the syntax tree only; the registry loader and the validator
 * both read it.
 */
class ImportGraph
{
public:
  ImportGraph() = default;
  explicit ImportGraph(std::string document_uri) : documentUri_(std::move(document_uri)) {}

  /// Collect the imports of a program
  [[nodiscard]] static ImportGraph from_program(const Program & program);

  void add(ImportRef ref) { imports_.push_back(std::move(ref)); }

  [[nodiscard]] const std::string & document_uri() const noexcept { return documentUri_; }
  [[nodiscard]] const std::vector<ImportRef> & imports() const noexcept { return imports_; }

  /// Default imports of a category, in source order
  [[nodiscard]] std::vector<const ImportRef *> defaults(ImportCategory category) const;

  /// Paths of stylesheet imports: `styles` defaults and css-typed named imports
  [[nodiscard]] std::vector<const ImportRef *> css_imports() const;

  [[nodiscard]] bool has_default(ImportCategory category) const
  {
    return !defaults(category).empty();
  }

private:
  std::string documentUri_;
  std::vector<ImportRef> imports_;
};

}  // namespace eligian
