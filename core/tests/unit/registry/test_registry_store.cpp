// tests/unit/registry/test_registry_store.cpp - Registry snapshots and document map
//

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "eligian/registry/registry.hpp"

using namespace eligian;

namespace
{

constexpr const char * k_doc = "file:///p/a.eligian";
constexpr const char * k_other = "file:///p/b.eligian";

}  // namespace

// ============================================================================
// FileRegistry
// ============================================================================

TEST(RegistryStoreTest, UpdateReplacesSnapshot)
{
  CssRegistry css;
  css.update("/p/main.css", CssEntry({"a"}, {}));
  const auto before = css.get("/p/main.css");

  css.update("/p/main.css", CssEntry({"b"}, {}));
  const auto after = css.get("/p/main.css");

  ASSERT_NE(before, nullptr);
  ASSERT_NE(after, nullptr);
  EXPECT_TRUE(before->has_class("a")) << "held snapshot is not modified by a reload";
  EXPECT_FALSE(before->has_class("b"));
  EXPECT_TRUE(after->has_class("b"));
  EXPECT_EQ(css.size(), 1u);
  EXPECT_EQ(css.get("/p/unknown.css"), nullptr);
}

TEST(RegistryStoreTest, ConcurrentReadersSeeWholeSnapshots)
{
  CssRegistry css;
  css.update("/p/main.css", CssEntry({"x0", "y0"}, {}));

  std::atomic<bool> stop{false};
  std::atomic<int> torn{0};
  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        const auto entry = css.get("/p/main.css");
        // Every written entry has exactly two classes with matching suffixes
        if (!entry || entry->classes().size() != 2 ||
            entry->classes()[0].substr(1) != entry->classes()[1].substr(1)) {
          ++torn;
        }
      }
    });
  }

  for (int i = 1; i <= 500; ++i) {
    const std::string n = std::to_string(i);
    css.update("/p/main.css", CssEntry({"x" + n, "y" + n}, {}));
  }
  stop = true;
  for (auto & t : readers) t.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_TRUE(css.get("/p/main.css")->has_class("x500"));
}

// ============================================================================
// Document queries
// ============================================================================

TEST(RegistryStoreTest, QueriesUnionImportedFiles)
{
  RegistryStore store;
  store.css().update("/p/a.css", CssEntry({"button", "primary"}, {"app"}));
  store.css().update("/p/b.css", CssEntry({"primary", "card"}, {"footer"}));
  store.css().update("/p/unused.css", CssEntry({"hidden"}, {}));
  store.set_document_imports(k_doc, DocumentImports{{"/p/a.css", "/p/b.css"}, {}, {}});

  EXPECT_EQ(store.classes_for(k_doc), (std::vector<std::string>{"button", "primary", "card"}));
  EXPECT_EQ(store.ids_for(k_doc), (std::vector<std::string>{"app", "footer"}));
  EXPECT_TRUE(store.has_class(k_doc, "card"));
  EXPECT_FALSE(store.has_class(k_doc, "hidden")) << "only files the document imports count";
  EXPECT_TRUE(store.has_id(k_doc, "footer"));
  EXPECT_TRUE(store.classes_for("file:///p/unknown.eligian").empty());
}

TEST(RegistryStoreTest, LabelAndLocaleQueries)
{
  RegistryStore store;
  LabelEntry labels;
  labels.labels.push_back(LabelInfo{"welcome", 1, {"en-US"}});
  labels.labels.push_back(LabelInfo{"bye", 0, {}});
  store.labels().update("/p/labels.json", std::move(labels));
  store.locales().update("/p/en.json", LocaleEntry{{"en-US"}, {"title"}});
  store.locales().update("/p/nl.json", LocaleEntry{{"nl-NL", "en-US"}, {"title"}});
  store.set_document_imports(
    k_doc, DocumentImports{{}, {"/p/labels.json"}, {"/p/en.json", "/p/nl.json"}});

  EXPECT_EQ(store.label_ids_for(k_doc), (std::vector<std::string>{"welcome", "bye"}));
  EXPECT_EQ(store.locale_languages_for(k_doc), (std::vector<std::string>{"en-US", "nl-NL"}));
}

TEST(RegistryStoreTest, RemoveDocumentKeepsSharedFiles)
{
  RegistryStore store;
  store.css().update("/p/shared.css", CssEntry({"a"}, {}));
  store.css().update("/p/own.css", CssEntry({"b"}, {}));
  store.set_document_imports(k_doc, DocumentImports{{"/p/shared.css", "/p/own.css"}, {}, {}});
  store.set_document_imports(k_other, DocumentImports{{"/p/shared.css"}, {}, {}});

  store.remove_document(k_doc);

  EXPECT_FALSE(store.has_document(k_doc));
  EXPECT_TRUE(store.has_document(k_other));
  EXPECT_TRUE(store.css().contains("/p/shared.css"));
  EXPECT_FALSE(store.css().contains("/p/own.css"));
  EXPECT_TRUE(store.has_class(k_other, "a"));
}

TEST(RegistryStoreTest, PublishDocumentRecordsImports)
{
  RegistryStore store;
  DocumentAssets assets;
  assets.css.emplace_back("/p/main.css", CssEntry({"button"}, {"app"}));
  assets.labels.emplace_back("/p/labels.json", LabelEntry{{LabelInfo{"welcome", 1, {"en-US"}}}});

  store.publish_document(k_doc, std::move(assets));

  EXPECT_EQ(store.document_imports(k_doc).css_files, (std::vector<std::string>{"/p/main.css"}));
  EXPECT_TRUE(store.has_class(k_doc, "button"));
  EXPECT_EQ(store.label_ids_for(k_doc), (std::vector<std::string>{"welcome"}));
  EXPECT_TRUE(store.locale_languages_for(k_doc).empty());
}

TEST(RegistryStoreTest, RemovingOneDocumentKeepsFilesAnotherIsPublishing)
{
  RegistryStore store;
  std::atomic<int> missing{0};

  // k_doc opens and closes over and over while k_other reloads the same file
  std::thread closer([&] {
    for (int i = 0; i < 500; ++i) {
      DocumentAssets assets;
      assets.css.emplace_back("/p/shared.css", CssEntry({"shared"}, {}));
      store.publish_document(k_doc, std::move(assets));
      store.remove_document(k_doc);
    }
  });
  std::thread loader([&] {
    for (int i = 0; i < 500; ++i) {
      DocumentAssets assets;
      assets.css.emplace_back("/p/shared.css", CssEntry({"shared"}, {}));
      store.publish_document(k_other, std::move(assets));
      if (!store.has_class(k_other, "shared")) ++missing;
    }
  });
  closer.join();
  loader.join();

  EXPECT_EQ(missing.load(), 0);
  EXPECT_FALSE(store.has_document(k_doc));
  EXPECT_TRUE(store.css().contains("/p/shared.css"));
}
