// eligian/registry/css_parser.hpp - Stylesheet and selector scanning
//
// Not a CSS parser in the full sense: only the class and id names a
// stylesheet declares, and the class and id tokens a selector uses, are
// of interest.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "eligian/registry/registry.hpp"

namespace eligian
{

/// Class and id names referenced by a selector, in order of appearance.
struct SelectorTokens
{
  std::vector<std::string> classes;
  std::vector<std::string> ids;
};

struct SelectorParseResult
{
  SelectorTokens tokens;
  std::optional<std::string> error;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  static SelectorParseResult success(SelectorTokens tokens) { return {std::move(tokens), std::nullopt}; }
  static SelectorParseResult failure(std::string message) { return {{}, std::move(message)}; }
};

/**
 * Extract `.class` and `#id` tokens from a selector list.
 *
 * Pseudo-classes (with their arguments) and attribute selectors are
 * skipped, so `.a:not(.b)` yields only `a` and `a[href="#x"]` yields nothing.
 * Fails on an empty selector, a dangling `.`/`#`, unbalanced brackets or an
 * unterminated string.
 */
[[nodiscard]] SelectorParseResult parse_selector(std::string_view selector);

/**
 * Collect the classes and ids declared by a stylesheet.
 *
 * Comments, strings and declaration blocks are ignored. Rules nested in
 * conditional group at-rules (`@media`, `@supports`, `@container`,
 * `@layer`, `@document`) are scanned; the contents of other at-rules
 * (`@font-face`, `@keyframes`, ...) are skipped. Never fails: malformed
 * input yields whatever could be read.
 */
[[nodiscard]] CssEntry parse_css(std::string_view text);

}  // namespace eligian
