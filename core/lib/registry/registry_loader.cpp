// eligian/registry/registry_loader.cpp - Registry population
//
#include "eligian/registry/registry_loader.hpp"

#include <optional>

#include "eligian/registry/css_parser.hpp"
#include "eligian/registry/json_assets.hpp"

namespace eligian
{

namespace
{

/// Resolve and read one import, reporting failures. Returns the resolved path on success.
std::optional<std::string> read_import(
  const ImportGraph & graph, const ImportRef & ref, const AssetLoader & loader,
  std::string & content, DiagnosticBag & diags)
{
  const PathResult resolved = loader.resolve_path(graph.document_uri(), ref.path);
  if (!resolved.success) {
    diags.report_error(ref.range, "Import path '" + ref.path + "' escapes the document directory")
      .with_code("PATH_TRAVERSAL")
      .with_help("Import paths must stay inside the directory of the importing file");
    return std::nullopt;
  }

  FileLoadResult file = loader.load_file(resolved.path);
  if (!file.success) {
    diags.report_error(ref.range, "File not found: '" + ref.path + "'")
      .with_code("FILE_NOT_FOUND")
      .with_help("Check that '" + resolved.path + "' exists and is readable");
    return std::nullopt;
  }

  content = std::move(file.content);
  return resolved.path;
}

}  // namespace

DiagnosticBag RegistryLoader::load(
  const ImportGraph & graph, const AssetLoader & loader, RegistryStore & store)
{
  DiagnosticBag diags;
  DocumentAssets assets;
  std::string content;

  for (const ImportRef * ref : graph.css_imports()) {
    const auto path = read_import(graph, *ref, loader, content, diags);
    if (!path) continue;
    assets.css.emplace_back(*path, parse_css(content));
  }

  for (const ImportRef * ref : graph.defaults(ImportCategory::Labels)) {
    const auto path = read_import(graph, *ref, loader, content, diags);
    if (!path) continue;
    LabelsParseResult parsed = parse_labels_json(content);
    if (!parsed.success) {
      diags.report_error(ref->range, "Invalid labels file '" + ref->path + "': " + parsed.error)
        .with_code("INVALID_LABELS_FILE")
        .with_help("Expected an array of {\"id\", \"labels\": [{\"languageCode\", \"label\"}]}");
      continue;
    }
    assets.labels.emplace_back(*path, std::move(parsed.entry));
  }

  for (const ImportRef * ref : graph.defaults(ImportCategory::Locales)) {
    const auto path = read_import(graph, *ref, loader, content, diags);
    if (!path) continue;
    LocaleParseResult parsed = parse_locale_json(content);
    if (!parsed.success) {
      diags.report_error(ref->range, "Invalid locale file '" + ref->path + "': " + parsed.error)
        .with_code("INVALID_LOCALE_FILE")
        .with_help("Expected an object keyed by language code, e.g. {\"en-US\": {...}}");
      continue;
    }
    assets.locales.emplace_back(*path, std::move(parsed.entry));
  }

  store.publish_document(graph.document_uri(), std::move(assets));
  return diags;
}

}  // namespace eligian
