// tests/unit/registry/test_css_parser.cpp - Stylesheet and selector scanning
//

#include <gtest/gtest.h>

#include "eligian/registry/css_parser.hpp"

using namespace eligian;

// ============================================================================
// Stylesheets
// ============================================================================

TEST(CssParserTest, CollectsClassesAndIds)
{
  const CssEntry css = parse_css(R"(
.button { color: red; }
#header .title, .button.primary:hover { margin: 0; }
)");

  EXPECT_EQ(css.classes(), (std::vector<std::string>{"button", "title", "primary"}));
  EXPECT_EQ(css.ids(), (std::vector<std::string>{"header"}));
  EXPECT_TRUE(css.has_class("primary"));
  EXPECT_FALSE(css.has_class("hover"));
}

TEST(CssParserTest, IgnoresDeclarationsAndComments)
{
  const CssEntry css = parse_css(R"(
/* .commented { } */
.real {
  background: url("img/.hidden#frag.png");
  content: ".fake #fake";
  width: 1.5em;
}
)");

  EXPECT_EQ(css.classes(), (std::vector<std::string>{"real"}));
  EXPECT_TRUE(css.ids().empty());
}

TEST(CssParserTest, ScansGroupAtRulesAndSkipsOthers)
{
  const CssEntry css = parse_css(R"(
@import url("other.css");
@media (max-width: 600px) {
  .mobile { display: none; }
  @supports (display: grid) { .grid { display: grid; } }
}
@keyframes fade { from { opacity: 0; } to { opacity: 1; } }
@font-face { font-family: "X"; src: url(x.woff); }
.after { }
)");

  EXPECT_EQ(css.classes(), (std::vector<std::string>{"mobile", "grid", "after"}));
}

TEST(CssParserTest, SkipsAttributesButScansPseudoArguments)
{
  const CssEntry css = parse_css(R"(a[href="#top"].link:not(.disabled) { })");

  EXPECT_EQ(css.classes(), (std::vector<std::string>{"link", "disabled"}));
  EXPECT_TRUE(css.ids().empty()) << "attribute values are not ids";
}

TEST(CssParserTest, CollectsClassesOnlyDeclaredInsidePseudoClasses)
{
  const CssEntry css = parse_css(R"(
.card:is(.featured, #hero) { color: red; }
li:nth-child(2n+1):where(.odd) { }
)");

  EXPECT_EQ(css.classes(), (std::vector<std::string>{"card", "featured", "odd"}));
  EXPECT_EQ(css.ids(), (std::vector<std::string>{"hero"}));
}

TEST(CssParserTest, ScansNestedRules)
{
  const CssEntry css = parse_css(R"(
.a {
  color: red;
  .nested { margin: 0; }
  &.active { color: blue }
  @media (min-width: 10px) { .wide { } }
  padding: 1px
}
.after { }
)");

  EXPECT_EQ(css.classes(), (std::vector<std::string>{"a", "nested", "active", "wide", "after"}));
}

TEST(CssParserTest, MalformedInputYieldsWhatWasRead)
{
  const CssEntry css = parse_css(".ok { } .broken { color: red;");

  EXPECT_TRUE(css.has_class("ok"));
  EXPECT_TRUE(css.has_class("broken"));
}

TEST(CssParserTest, DuplicatesKeepFirstOccurrence)
{
  const CssEntry css = parse_css(".a {} .b {} .a.b {}");
  EXPECT_EQ(css.classes(), (std::vector<std::string>{"a", "b"}));
}

// ============================================================================
// Selectors
// ============================================================================

TEST(SelectorParserTest, ExtractsTokensInOrder)
{
  const auto result = parse_selector("#app > .button.primary:hover");

  ASSERT_TRUE(result.ok()) << *result.error;
  EXPECT_EQ(result.tokens.classes, (std::vector<std::string>{"button", "primary"}));
  EXPECT_EQ(result.tokens.ids, (std::vector<std::string>{"app"}));
}

TEST(SelectorParserTest, IncludesPseudoClassArguments)
{
  const auto negated = parse_selector(".item:not(.disabled)");
  ASSERT_TRUE(negated.ok()) << *negated.error;
  EXPECT_EQ(negated.tokens.classes, (std::vector<std::string>{"item", "disabled"}));

  const auto nth = parse_selector("li:nth-child(2n+1) > #list:has(.empty)");
  ASSERT_TRUE(nth.ok()) << *nth.error;
  EXPECT_EQ(nth.tokens.classes, (std::vector<std::string>{"empty"}));
  EXPECT_EQ(nth.tokens.ids, (std::vector<std::string>{"list"}));
}

TEST(SelectorParserTest, ElementSelectorHasNoTokens)
{
  const auto result = parse_selector("div p");

  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.tokens.classes.empty());
  EXPECT_TRUE(result.tokens.ids.empty());
}

TEST(SelectorParserTest, RejectsMalformedSelectors)
{
  EXPECT_FALSE(parse_selector("").ok());
  EXPECT_FALSE(parse_selector("   ").ok());
  EXPECT_FALSE(parse_selector(".").ok());
  EXPECT_FALSE(parse_selector(".a #").ok());
  EXPECT_FALSE(parse_selector("a[href").ok());
  EXPECT_FALSE(parse_selector(".a:not(.b").ok());
  EXPECT_FALSE(parse_selector(".a]").ok());
  EXPECT_FALSE(parse_selector("a[title='x]").ok());
  EXPECT_FALSE(parse_selector(".a:is(.b))").ok());
}
