// eligian/registry/registry.cpp - Registry entries and document map
//
#include "eligian/registry/registry.hpp"

#include <algorithm>

namespace eligian
{

namespace
{

void append_unique(
  std::vector<std::string> & out, std::unordered_set<std::string> & seen,
  const std::vector<std::string> & values)
{
  for (const auto & v : values) {
    if (seen.insert(v).second) {
      out.push_back(v);
    }
  }
}

bool contains_file(const std::vector<std::string> & files, const std::string & file)
{
  return std::find(files.begin(), files.end(), file) != files.end();
}

}  // namespace

// ============================================================================
// Entries
// ============================================================================

CssEntry::CssEntry(std::vector<std::string> classes, std::vector<std::string> ids)
{
  // Keep first occurrence only
  append_unique(classes_, classSet_, classes);
  append_unique(ids_, idSet_, ids);
}

bool CssEntry::has_class(std::string_view name) const
{
  return classSet_.count(std::string(name)) != 0;
}

bool CssEntry::has_id(std::string_view name) const
{
  return idSet_.count(std::string(name)) != 0;
}

const LabelInfo * LabelEntry::find(std::string_view id) const noexcept
{
  for (const auto & label : labels) {
    if (label.id == id) return &label;
  }
  return nullptr;
}

bool LocaleEntry::has_language(std::string_view code) const noexcept
{
  return std::find(language_codes.begin(), language_codes.end(), code) != language_codes.end();
}

// ============================================================================
// RegistryStore: document map
// ============================================================================

void RegistryStore::set_document_imports(const std::string & document_uri, DocumentImports imports)
{
  std::unique_lock lock(documentsMutex_);
  documents_[document_uri] = std::move(imports);
}

void RegistryStore::publish_document(const std::string & document_uri, DocumentAssets assets)
{
  DocumentImports imports;
  std::unique_lock lock(documentsMutex_);

  for (auto & [file, entry] : assets.css) {
    css_.update(file, std::move(entry));
    imports.css_files.push_back(file);
  }
  for (auto & [file, entry] : assets.labels) {
    labels_.update(file, std::move(entry));
    imports.label_files.push_back(file);
  }
  for (auto & [file, entry] : assets.locales) {
    locales_.update(file, std::move(entry));
    imports.locale_files.push_back(file);
  }

  documents_[document_uri] = std::move(imports);
}

DocumentImports RegistryStore::document_imports(const std::string & document_uri) const
{
  std::shared_lock lock(documentsMutex_);
  const auto it = documents_.find(document_uri);
  return it == documents_.end() ? DocumentImports{} : it->second;
}

bool RegistryStore::has_document(const std::string & document_uri) const
{
  std::shared_lock lock(documentsMutex_);
  return documents_.count(document_uri) != 0;
}

void RegistryStore::remove_document(const std::string & document_uri)
{
  // Held until pruning is done; publish_document() takes the same lock
  std::unique_lock lock(documentsMutex_);
  const auto it = documents_.find(document_uri);
  if (it == documents_.end()) return;
  const DocumentImports removed = std::move(it->second);
  documents_.erase(it);

  std::vector<std::string> still_used_css;
  std::vector<std::string> still_used_labels;
  std::vector<std::string> still_used_locales;
  for (const auto & [uri, imports] : documents_) {
    still_used_css.insert(still_used_css.end(), imports.css_files.begin(), imports.css_files.end());
    still_used_labels.insert(
      still_used_labels.end(), imports.label_files.begin(), imports.label_files.end());
    still_used_locales.insert(
      still_used_locales.end(), imports.locale_files.begin(), imports.locale_files.end());
  }

  for (const auto & file : removed.css_files) {
    if (!contains_file(still_used_css, file)) css_.remove(file);
  }
  for (const auto & file : removed.label_files) {
    if (!contains_file(still_used_labels, file)) labels_.remove(file);
  }
  for (const auto & file : removed.locale_files) {
    if (!contains_file(still_used_locales, file)) locales_.remove(file);
  }
}

// ============================================================================
// RegistryStore: queries
// ============================================================================

std::vector<std::string> RegistryStore::classes_for(const std::string & document_uri) const
{
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto & file : document_imports(document_uri).css_files) {
    if (const auto entry = css_.get(file)) {
      append_unique(out, seen, entry->classes());
    }
  }
  return out;
}

std::vector<std::string> RegistryStore::ids_for(const std::string & document_uri) const
{
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto & file : document_imports(document_uri).css_files) {
    if (const auto entry = css_.get(file)) {
      append_unique(out, seen, entry->ids());
    }
  }
  return out;
}

bool RegistryStore::has_class(const std::string & document_uri, std::string_view name) const
{
  for (const auto & file : document_imports(document_uri).css_files) {
    const auto entry = css_.get(file);
    if (entry && entry->has_class(name)) return true;
  }
  return false;
}

bool RegistryStore::has_id(const std::string & document_uri, std::string_view name) const
{
  for (const auto & file : document_imports(document_uri).css_files) {
    const auto entry = css_.get(file);
    if (entry && entry->has_id(name)) return true;
  }
  return false;
}

std::vector<std::string> RegistryStore::label_ids_for(const std::string & document_uri) const
{
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto & file : document_imports(document_uri).label_files) {
    if (const auto entry = labels_.get(file)) {
      for (const auto & label : entry->labels) {
        if (seen.insert(label.id).second) out.push_back(label.id);
      }
    }
  }
  return out;
}

std::vector<std::string> RegistryStore::locale_languages_for(
  const std::string & document_uri) const
{
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto & file : document_imports(document_uri).locale_files) {
    if (const auto entry = locales_.get(file)) {
      append_unique(out, seen, entry->language_codes);
    }
  }
  return out;
}

}  // namespace eligian
