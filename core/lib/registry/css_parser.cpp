// eligian/registry/css_parser.cpp - Stylesheet and selector scanning
//
#include "eligian/registry/css_parser.hpp"

#include <array>
#include <cctype>

namespace eligian
{
namespace
{

bool is_name_char(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '-' || c == '_' || c >= 0x80;
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

/// At-rules whose block holds ordinary style rules
bool is_group_at_rule(std::string_view name)
{
  constexpr std::array<std::string_view, 5> k_group_rules = {
    "media", "supports", "container", "layer", "document"};
  for (const auto rule : k_group_rules) {
    if (name == rule) return true;
  }
  return false;
}

// ============================================================================
// Selector scanning
// ============================================================================

class SelectorScanner
{
public:
  explicit SelectorScanner(std::string_view src) : src_(src) {}

  /// Scan the whole selector; tokens read before an error are kept
  std::optional<std::string> scan(SelectorTokens & out)
  {
    while (!eof()) {
      const char c = peek();
      if (c == '"' || c == '\'') {
        if (!skip_string()) return "unterminated string in selector";
      } else if (c == '/' && peek(1) == '*') {
        if (!skip_comment()) return "unterminated comment in selector";
      } else if (c == '[') {
        if (!skip_balanced('[', ']')) return "unbalanced '[' in selector";
      } else if (c == ':') {
        advance(1);
        if (peek() == ':') advance(1);
        (void)read_name();
        // Pseudo-class arguments such as :not(.x) hold selectors
        if (peek() == '(') {
          advance(1);
          ++parenDepth_;
        }
      } else if (c == '(') {
        advance(1);
        ++parenDepth_;
      } else if (c == ')' && parenDepth_ > 0) {
        advance(1);
        --parenDepth_;
      } else if (c == '.' || c == '#') {
        advance(1);
        std::string name = read_name();
        if (name.empty()) {
          return std::string("expected a name after '") + c + "'";
        }
        (c == '.' ? out.classes : out.ids).push_back(std::move(name));
      } else if (c == ']' || c == ')') {
        return std::string("unexpected '") + c + "' in selector";
      } else {
        advance(1);
      }
    }
    if (parenDepth_ > 0) return "unbalanced '(' in selector";
    return std::nullopt;
  }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t ahead = 0) const noexcept
  {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }
  void advance(size_t n) noexcept { pos_ += n; }

  std::string read_name()
  {
    std::string name;
    while (!eof()) {
      const auto c = static_cast<unsigned char>(peek());
      if (c == '\\' && pos_ + 1 < src_.size()) {
        // Escaped character is part of the name
        name += src_[pos_ + 1];
        advance(2);
      } else if (is_name_char(c)) {
        name += static_cast<char>(c);
        advance(1);
      } else {
        break;
      }
    }
    return name;
  }

  bool skip_string()
  {
    const char quote = peek();
    advance(1);
    while (!eof()) {
      const char c = peek();
      if (c == '\\') {
        advance(2);
        continue;
      }
      advance(1);
      if (c == quote) return true;
    }
    return false;
  }

  bool skip_comment()
  {
    const auto end = src_.find("*/", pos_ + 2);
    if (end == std::string_view::npos) {
      pos_ = src_.size();
      return false;
    }
    pos_ = end + 2;
    return true;
  }

  bool skip_balanced(char open, char close)
  {
    int depth = 0;
    while (!eof()) {
      const char c = peek();
      if (c == '"' || c == '\'') {
        if (!skip_string()) return false;
        continue;
      }
      advance(1);
      if (c == open) {
        ++depth;
      } else if (c == close) {
        if (--depth == 0) return true;
      }
    }
    return false;
  }

  std::string_view src_;
  size_t pos_ = 0;
  int parenDepth_ = 0;
};

// ============================================================================
// Stylesheet scanning
// ============================================================================

class StylesheetScanner
{
public:
  explicit StylesheetScanner(std::string_view src) : src_(src) {}

  CssEntry run()
  {
    scan_rules(false);
    return CssEntry(std::move(tokens_.classes), std::move(tokens_.ids));
  }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t ahead = 0) const noexcept
  {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }
  void advance(size_t n) noexcept { pos_ += n; }

  void skip_comment()
  {
    const auto end = src_.find("*/", pos_ + 2);
    pos_ = end == std::string_view::npos ? src_.size() : end + 2;
  }

  void skip_string()
  {
    const char quote = peek();
    advance(1);
    while (!eof()) {
      const char c = peek();
      advance(c == '\\' ? 2 : 1);
      if (c == quote) return;
    }
  }

  void skip_trivia()
  {
    while (!eof()) {
      if (is_space(peek())) {
        advance(1);
      } else if (peek() == '/' && peek(1) == '*') {
        skip_comment();
      } else {
        return;
      }
    }
  }

  /// Text up to '{', ';' or '}' at bracket depth 0, with comments blanked
  std::string read_prelude()
  {
    std::string text;
    int depth = 0;
    while (!eof()) {
      const char c = peek();
      if (c == '/' && peek(1) == '*') {
        skip_comment();
        text += ' ';
        continue;
      }
      if (c == '"' || c == '\'') {
        const size_t start = pos_;
        skip_string();
        text.append(src_.substr(start, pos_ - start));
        continue;
      }
      if (depth == 0 && (c == '{' || c == ';' || c == '}')) {
        break;
      }
      if (c == '(' || c == '[') ++depth;
      if ((c == ')' || c == ']') && depth > 0) --depth;
      text += c;
      advance(1);
    }
    return text;
  }

  /// Skip a declaration block; the opening '{' is already consumed
  void skip_block()
  {
    int depth = 1;
    while (!eof() && depth > 0) {
      const char c = peek();
      if (c == '/' && peek(1) == '*') {
        skip_comment();
      } else if (c == '"' || c == '\'') {
        skip_string();
      } else {
        if (c == '{') ++depth;
        if (c == '}') --depth;
        advance(1);
      }
    }
  }

  void scan_rules(bool nested)
  {
    while (true) {
      skip_trivia();
      if (eof()) return;

      if (peek() == '}') {
        advance(1);
        if (nested) return;
        continue;
      }

      if (peek() == '@') {
        advance(1);
        std::string name;
        while (!eof() && is_name_char(static_cast<unsigned char>(peek()))) {
          name += static_cast<char>(std::tolower(static_cast<unsigned char>(peek())));
          advance(1);
        }
        (void)read_prelude();
        if (peek() == '{') {
          advance(1);
          if (is_group_at_rule(name)) {
            scan_rules(true);
          } else {
            skip_block();
          }
        } else if (peek() == ';') {
          advance(1);
        }
        continue;
      }

      const std::string prelude = read_prelude();
      if (peek() == '{') {
        advance(1);
        // Best effort: keep the tokens read before any selector error
        (void)SelectorScanner(prelude).scan(tokens_);
        // Declarations end at ';' and are dropped, nested rules are scanned
        scan_rules(true);
      } else if (peek() == ';') {
        advance(1);
      }
    }
  }

  std::string_view src_;
  size_t pos_ = 0;
  SelectorTokens tokens_;
};

}  // namespace

SelectorParseResult parse_selector(std::string_view selector)
{
  size_t first = 0;
  while (first < selector.size() && is_space(selector[first])) ++first;
  if (first == selector.size()) {
    return SelectorParseResult::failure("empty selector");
  }

  SelectorTokens tokens;
  if (auto error = SelectorScanner(selector).scan(tokens)) {
    return SelectorParseResult::failure(std::move(*error));
  }
  return SelectorParseResult::success(std::move(tokens));
}

CssEntry parse_css(std::string_view text)
{
  return StylesheetScanner(text).run();
}

}  // namespace eligian
