// tests/unit/registry/test_registry_loader.cpp - Loading imported assets into registries
//

#include <gtest/gtest.h>

#include "eligian/registry/registry_loader.hpp"
#include "eligian/test_support/memory_assets.hpp"

using namespace eligian;
using namespace eligian::test_support;

namespace
{

constexpr const char * k_doc = "file:///project/presentation.eligian";

ImportRef default_ref(ImportCategory category, const std::string & path)
{
  ImportRef ref;
  ref.kind = ImportKind::Default;
  ref.category = category;
  ref.name = std::string(to_string(category));
  ref.path = path;
  return ref;
}

ImportRef css_named_ref(const std::string & name, const std::string & path)
{
  ImportRef ref;
  ref.kind = ImportKind::Named;
  ref.name = name;
  ref.path = path;
  return ref;
}

std::vector<std::string> codes_of(const DiagnosticBag & diags)
{
  std::vector<std::string> codes;
  for (const auto & d : diags) {
    codes.push_back(d.code);
  }
  return codes;
}

}  // namespace

// ============================================================================
// Path resolution
// ============================================================================

TEST(RegistryLoaderTest, ResolveWithinStaysInsideBase)
{
  EXPECT_EQ(resolve_within("/project", "./main.css").path, "/project/main.css");
  EXPECT_EQ(resolve_within("/project", "./a/../b.css").path, "/project/b.css");
  EXPECT_FALSE(resolve_within("/project", "../secret.css").success);
  EXPECT_FALSE(resolve_within("/project", "./a/../../x.css").success);
  EXPECT_FALSE(resolve_within("/project", "/etc/passwd").success);
}

TEST(RegistryLoaderTest, UriToPathStripsFileScheme)
{
  EXPECT_EQ(uri_to_path("file:///project/a.eligian"), "/project/a.eligian");
  EXPECT_EQ(uri_to_path("/project/a.eligian"), "/project/a.eligian");
}

// ============================================================================
// Loading
// ============================================================================

TEST(RegistryLoaderTest, LoadsAllAssetKinds)
{
  MemoryAssetLoader loader;
  loader.add("/project/main.css", ".button { } #app { }");
  loader.add("/project/theme.css", ".dark { }");
  loader.add("/project/labels.json", R"([{"id": "welcome", "labels": []}])");
  loader.add("/project/locales.json", R"({"en-US": {"title": "Hi"}})");

  ImportGraph graph(k_doc);
  graph.add(default_ref(ImportCategory::Styles, "./main.css"));
  graph.add(css_named_ref("theme", "./theme.css"));
  graph.add(default_ref(ImportCategory::Labels, "./labels.json"));
  graph.add(default_ref(ImportCategory::Locales, "./locales.json"));

  RegistryStore store;
  const DiagnosticBag diags = RegistryLoader::load(graph, loader, store);

  EXPECT_TRUE(diags.empty()) << "unexpected: " << diags.begin()->message;
  EXPECT_EQ(store.classes_for(k_doc), (std::vector<std::string>{"button", "dark"}));
  EXPECT_TRUE(store.has_id(k_doc, "app"));
  EXPECT_EQ(store.label_ids_for(k_doc), (std::vector<std::string>{"welcome"}));
  EXPECT_EQ(store.locale_languages_for(k_doc), (std::vector<std::string>{"en-US"}));
}

TEST(RegistryLoaderTest, RejectsPathTraversal)
{
  MemoryAssetLoader loader;
  loader.add("/secret.css", ".leak { }");

  ImportGraph graph(k_doc);
  graph.add(default_ref(ImportCategory::Styles, "../secret.css"));

  RegistryStore store;
  const DiagnosticBag diags = RegistryLoader::load(graph, loader, store);

  EXPECT_EQ(codes_of(diags), (std::vector<std::string>{"PATH_TRAVERSAL"}));
  EXPECT_FALSE(store.css().contains("/secret.css")) << "file outside the directory is never read";
  EXPECT_TRUE(store.document_imports(k_doc).css_files.empty());
}

TEST(RegistryLoaderTest, ReportsMissingAndInvalidFilesAndContinues)
{
  MemoryAssetLoader loader;
  loader.add("/project/labels.json", R"({"not": "an array"})");
  loader.add("/project/locales.json", R"({"en-US": {"n": 1}})");
  loader.add("/project/ok.css", ".ok { }");

  ImportGraph graph(k_doc);
  graph.add(default_ref(ImportCategory::Styles, "./missing.css"));
  graph.add(default_ref(ImportCategory::Styles, "./ok.css"));
  graph.add(default_ref(ImportCategory::Labels, "./labels.json"));
  graph.add(default_ref(ImportCategory::Locales, "./locales.json"));

  RegistryStore store;
  const DiagnosticBag diags = RegistryLoader::load(graph, loader, store);

  ASSERT_EQ(
    codes_of(diags),
    (std::vector<std::string>{"FILE_NOT_FOUND", "INVALID_LABELS_FILE", "INVALID_LOCALE_FILE"}));
  EXPECT_NE(diags.begin()->message.find("./missing.css"), std::string::npos);

  const DocumentImports imports = store.document_imports(k_doc);
  EXPECT_EQ(imports.css_files, (std::vector<std::string>{"/project/ok.css"}));
  EXPECT_TRUE(imports.label_files.empty()) << "failed files stay out of the document map";
  EXPECT_TRUE(imports.locale_files.empty());
}

TEST(RegistryLoaderTest, ReloadPicksUpChangedContent)
{
  MemoryAssetLoader loader;
  loader.add("/project/main.css", ".old { }");

  ImportGraph graph(k_doc);
  graph.add(default_ref(ImportCategory::Styles, "./main.css"));

  RegistryStore store;
  (void)RegistryLoader::load(graph, loader, store);
  EXPECT_TRUE(store.has_class(k_doc, "old"));

  loader.add("/project/main.css", ".new { }");
  (void)RegistryLoader::load(graph, loader, store);
  EXPECT_FALSE(store.has_class(k_doc, "old"));
  EXPECT_TRUE(store.has_class(k_doc, "new"));
}
