// eligian/ir/import_graph.cpp - Import graph construction
//
#include "eligian/ir/import_graph.hpp"

#include <algorithm>
#include <cctype>

#include "eligian/basic/casting.hpp"

namespace eligian
{

std::string file_extension(std::string_view path)
{
  const auto slash = path.find_last_of("/\\");
  const auto file = slash == std::string_view::npos ? path : path.substr(slash + 1);
  const auto dot = file.rfind('.');
  if (dot == std::string_view::npos || dot + 1 == file.size()) {
    return {};
  }

  std::string ext(file.substr(dot + 1));
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

ExtensionType classify_extension(std::string_view path)
{
  const std::string ext = file_extension(path);

  if (ext == "html") return ExtensionType::Html;
  if (ext == "css") return ExtensionType::Css;
  if (ext == "mp4" || ext == "webm" || ext == "mp3" || ext == "wav") return ExtensionType::Media;
  // Audio or video container
  if (ext == "ogg") return ExtensionType::Ambiguous;
  return ExtensionType::Unknown;
}

std::optional<AssetType> ImportRef::effective_type() const
{
  if (explicit_type) return explicit_type;
  switch (classify_extension(path)) {
    case ExtensionType::Html:
      return AssetType::Html;
    case ExtensionType::Css:
      return AssetType::Css;
    case ExtensionType::Media:
      return AssetType::Media;
    case ExtensionType::Ambiguous:
    case ExtensionType::Unknown:
      break;
  }
  return std::nullopt;
}

ImportGraph ImportGraph::from_program(const Program & program)
{
  ImportGraph graph{std::string(program.uri)};

  for (const Decl * decl : program.imports) {
    ImportRef ref;
    ref.range = decl->get_range();

    if (const auto * def = dyn_cast<DefaultImportDecl>(decl)) {
      ref.kind = ImportKind::Default;
      ref.category = def->category;
      ref.name = std::string(to_string(def->category));
      ref.path = std::string(def->path);
    } else if (const auto * named = dyn_cast<NamedImportDecl>(decl)) {
      ref.kind = ImportKind::Named;
      ref.name = std::string(named->name);
      ref.path = std::string(named->path);
      ref.explicit_type = named->assetType;
    } else {
      continue;
    }

    graph.add(std::move(ref));
  }

  return graph;
}

std::vector<const ImportRef *> ImportGraph::defaults(ImportCategory category) const
{
  std::vector<const ImportRef *> out;
  for (const auto & ref : imports_) {
    if (ref.kind == ImportKind::Default && ref.category == category) {
      out.push_back(&ref);
    }
  }
  return out;
}

std::vector<const ImportRef *> ImportGraph::css_imports() const
{
  std::vector<const ImportRef *> out;
  for (const auto & ref : imports_) {
    const bool is_styles = ref.kind == ImportKind::Default && ref.category == ImportCategory::Styles;
    const bool is_css_named =
      ref.kind == ImportKind::Named && ref.effective_type() == AssetType::Css;
    if (is_styles || is_css_named) {
      out.push_back(&ref);
    }
  }
  return out;
}

}  // namespace eligian
