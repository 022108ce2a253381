// eligian/registry/registry.hpp - Document-scoped CSS, label and locale registries
//
// Registries cache what the imported asset files of a document declare:
// CSS classes and ids, label ids, locale languages and keys. They are the
// only shared mutable state of the compiler core.
//
// Entries are immutable snapshots held by shared_ptr<const Entry>. A reload
// swaps the pointer under a unique lock, so a reader that already holds a
// snapshot keeps a consistent view.
//
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace eligian
{

// ============================================================================
// Entries
// ============================================================================

/// Classes and ids declared by one stylesheet, in first-seen order.
class CssEntry
{
public:
  CssEntry() = default;
  CssEntry(std::vector<std::string> classes, std::vector<std::string> ids);

  [[nodiscard]] const std::vector<std::string> & classes() const noexcept { return classes_; }
  [[nodiscard]] const std::vector<std::string> & ids() const noexcept { return ids_; }

  [[nodiscard]] bool has_class(std::string_view name) const;
  [[nodiscard]] bool has_id(std::string_view name) const;

private:
  std::vector<std::string> classes_;
  std::vector<std::string> ids_;
  std::unordered_set<std::string> classSet_;
  std::unordered_set<std::string> idSet_;
};

struct LabelInfo
{
  std::string id;
  size_t translation_count = 0;
  std::vector<std::string> language_codes;
};

/// Label groups of one labels file, in file order.
struct LabelEntry
{
  std::vector<LabelInfo> labels;

  [[nodiscard]] const LabelInfo * find(std::string_view id) const noexcept;
};

/// Languages and dot-joined translation keys of one locale file.
struct LocaleEntry
{
  std::vector<std::string> language_codes;
  std::vector<std::string> translation_keys;

  [[nodiscard]] bool has_language(std::string_view code) const noexcept;
};

// ============================================================================
// FileRegistry
// ============================================================================

/**
 * Thread-safe map from asset file URI to an immutable entry.
 *
 * Readers take a shared lock; update() and remove() take a unique lock and
 * replace the stored pointer wholesale.
 */
template <typename Entry>
class FileRegistry
{
public:
  using EntryPtr = std::shared_ptr<const Entry>;

  FileRegistry() = default;
  FileRegistry(const FileRegistry &) = delete;
  FileRegistry & operator=(const FileRegistry &) = delete;

  void update(const std::string & file_uri, Entry entry)
  {
    auto snapshot = std::make_shared<const Entry>(std::move(entry));
    std::unique_lock lock(mutex_);
    entries_[file_uri] = std::move(snapshot);
  }

  /// Snapshot for a file, nullptr if it was never loaded
  [[nodiscard]] EntryPtr get(const std::string & file_uri) const
  {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(file_uri);
    return it == entries_.end() ? nullptr : it->second;
  }

  [[nodiscard]] bool contains(const std::string & file_uri) const
  {
    std::shared_lock lock(mutex_);
    return entries_.count(file_uri) != 0;
  }

  bool remove(const std::string & file_uri)
  {
    std::unique_lock lock(mutex_);
    return entries_.erase(file_uri) != 0;
  }

  [[nodiscard]] size_t size() const
  {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

  void clear()
  {
    std::unique_lock lock(mutex_);
    entries_.clear();
  }

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, EntryPtr> entries_;
};

using CssRegistry = FileRegistry<CssEntry>;
using LabelRegistry = FileRegistry<LabelEntry>;
using LocaleRegistry = FileRegistry<LocaleEntry>;

// ============================================================================
// RegistryStore
// ============================================================================

/// Asset files a document imports, by kind.
struct DocumentImports
{
  std::vector<std::string> css_files;
  std::vector<std::string> label_files;
  std::vector<std::string> locale_files;
};

/// Parsed asset files of one document, keyed by resolved path.
struct DocumentAssets
{
  std::vector<std::pair<std::string, CssEntry>> css;
  std::vector<std::pair<std::string, LabelEntry>> labels;
  std::vector<std::pair<std::string, LocaleEntry>> locales;
};

/**
 * The three registries plus the document → imported files map.
 *
 * Passed by reference to the loader and the validator; there is no global
 * instance.
 */
class RegistryStore
{
public:
  RegistryStore() = default;
  RegistryStore(const RegistryStore &) = delete;
  RegistryStore & operator=(const RegistryStore &) = delete;

  [[nodiscard]] CssRegistry & css() noexcept { return css_; }
  [[nodiscard]] const CssRegistry & css() const noexcept { return css_; }
  [[nodiscard]] LabelRegistry & labels() noexcept { return labels_; }
  [[nodiscard]] const LabelRegistry & labels() const noexcept { return labels_; }
  [[nodiscard]] LocaleRegistry & locales() noexcept { return locales_; }
  [[nodiscard]] const LocaleRegistry & locales() const noexcept { return locales_; }

  // ===========================================================================
  // Document map
  // ===========================================================================

  void set_document_imports(const std::string & document_uri, DocumentImports imports);

  /**
   * Swap in a document's parsed files and record them as its imports.
   *
   * Runs under the document map lock, so a concurrent remove_document() of
   * another document sharing a file either sees this document's imports or
   * finishes before the entries are written.
   */
  void publish_document(const std::string & document_uri, DocumentAssets assets);

  /// Files imported by a document; empty if the document is unknown
  [[nodiscard]] DocumentImports document_imports(const std::string & document_uri) const;

  [[nodiscard]] bool has_document(const std::string & document_uri) const;

  /**
   * Forget a document. Registry entries no other open document imports are
   * dropped with it.
   */
  void remove_document(const std::string & document_uri);

  // ===========================================================================
  // Per-document queries
  // ===========================================================================

  /// Union of the classes of the document's stylesheets, first-seen order
  [[nodiscard]] std::vector<std::string> classes_for(const std::string & document_uri) const;
  [[nodiscard]] std::vector<std::string> ids_for(const std::string & document_uri) const;

  [[nodiscard]] bool has_class(const std::string & document_uri, std::string_view name) const;
  [[nodiscard]] bool has_id(const std::string & document_uri, std::string_view name) const;

  /// Label ids of the document's labels files, file order
  [[nodiscard]] std::vector<std::string> label_ids_for(const std::string & document_uri) const;

  /// Language codes of the document's locale files
  [[nodiscard]] std::vector<std::string> locale_languages_for(
    const std::string & document_uri) const;

private:
  CssRegistry css_;
  LabelRegistry labels_;
  LocaleRegistry locales_;

  mutable std::shared_mutex documentsMutex_;
  std::map<std::string, DocumentImports> documents_;
};

}  // namespace eligian
