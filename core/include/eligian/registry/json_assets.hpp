// eligian/registry/json_assets.hpp - Labels and locale file parsing
//
#pragma once

#include <string>
#include <string_view>

#include "eligian/registry/registry.hpp"

namespace eligian
{

/**
 * Result of parsing a labels file.
 */
struct LabelsParseResult
{
  LabelEntry entry;
  bool success = false;
  std::string error;

  static LabelsParseResult ok(LabelEntry e)
  {
    LabelsParseResult r;
    r.entry = std::move(e);
    r.success = true;
    return r;
  }

  static LabelsParseResult fail(std::string msg)
  {
    LabelsParseResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Result of parsing a locale file.
 */
struct LocaleParseResult
{
  LocaleEntry entry;
  bool success = false;
  std::string error;

  static LocaleParseResult ok(LocaleEntry e)
  {
    LocaleParseResult r;
    r.entry = std::move(e);
    r.success = true;
    return r;
  }

  static LocaleParseResult fail(std::string msg)
  {
    LocaleParseResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Parse a labels file:
 * @code
 *   [{"id": "welcome", "labels": [{"languageCode": "en-US", "label": "Welcome"}]}]
 * @endcode
 */
[[nodiscard]] LabelsParseResult parse_labels_json(std::string_view text);

/**
 * Parse a locale file. Top-level keys are language codes; nested objects
 * are flattened to dot-joined translation keys:
 * @code
 *   {"en-US": {"nav": {"home": "Home"}}}   // key "nav.home"
 * @endcode
 */
[[nodiscard]] LocaleParseResult parse_locale_json(std::string_view text);

}  // namespace eligian
