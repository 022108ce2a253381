// eligian/registry/json_assets.cpp - Labels and locale file parsing
//
#include "eligian/registry/json_assets.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_set>

namespace eligian
{

using nlohmann::json;

namespace
{

std::optional<json> parse_json(std::string_view text, std::string & error)
{
  try {
    return json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    error = std::string("invalid JSON: ") + e.what();
    return std::nullopt;
  }
}

/// Flatten nested objects into dot-joined keys; false on a non-string leaf
bool collect_keys(
  const json & node, const std::string & prefix, std::vector<std::string> & keys,
  std::unordered_set<std::string> & seen, std::string & error)
{
  for (const auto & item : node.items()) {
    const std::string & key = item.key();
    const json & value = item.value();
    const std::string path = prefix.empty() ? key : prefix + "." + key;
    if (value.is_object()) {
      if (!collect_keys(value, path, keys, seen, error)) return false;
    } else if (value.is_string()) {
      if (seen.insert(path).second) keys.push_back(path);
    } else {
      error = "translation '" + path + "' must be a string or an object";
      return false;
    }
  }
  return true;
}

}  // namespace

LabelsParseResult parse_labels_json(std::string_view text)
{
  std::string error;
  const auto root = parse_json(text, error);
  if (!root) {
    return LabelsParseResult::fail(error);
  }
  if (!root->is_array()) {
    return LabelsParseResult::fail("labels file must contain an array of label groups");
  }

  LabelEntry entry;
  for (size_t i = 0; i < root->size(); ++i) {
    const json & group = (*root)[i];
    const std::string where = "labels[" + std::to_string(i) + "]";
    if (!group.is_object()) {
      return LabelsParseResult::fail(where + " must be an object");
    }
    const auto id = group.find("id");
    if (id == group.end() || !id->is_string()) {
      return LabelsParseResult::fail(where + ".id must be a string");
    }

    LabelInfo info;
    info.id = id->get<std::string>();

    const auto translations = group.find("labels");
    if (translations != group.end()) {
      if (!translations->is_array()) {
        return LabelsParseResult::fail(where + ".labels must be an array");
      }
      for (const auto & t : *translations) {
        const auto code = t.is_object() ? t.find("languageCode") : t.end();
        if (!t.is_object() || code == t.end() || !code->is_string()) {
          return LabelsParseResult::fail(where + ".labels entries need a string languageCode");
        }
        info.language_codes.push_back(code->get<std::string>());
      }
      info.translation_count = translations->size();
    }

    entry.labels.push_back(std::move(info));
  }

  return LabelsParseResult::ok(std::move(entry));
}

LocaleParseResult parse_locale_json(std::string_view text)
{
  std::string error;
  const auto root = parse_json(text, error);
  if (!root) {
    return LocaleParseResult::fail(error);
  }
  if (!root->is_object()) {
    return LocaleParseResult::fail("locale file must contain an object keyed by language code");
  }

  LocaleEntry entry;
  std::unordered_set<std::string> seen;
  for (const auto & item : root->items()) {
    const std::string & code = item.key();
    const json & translations = item.value();
    if (!translations.is_object()) {
      return LocaleParseResult::fail("translations for '" + code + "' must be an object");
    }
    entry.language_codes.push_back(code);
    if (!collect_keys(translations, "", entry.translation_keys, seen, error)) {
      return LocaleParseResult::fail(code + ": " + error);
    }
  }

  return LocaleParseResult::ok(std::move(entry));
}

}  // namespace eligian
