// tests/unit/ast/test_syntax_tree_reader.cpp - JSON syntax tree reader tests
//

#include <gtest/gtest.h>

#include "eligian/ast/ast.hpp"
#include "eligian/ast/syntax_tree_provider.hpp"
#include "eligian/basic/casting.hpp"
#include "eligian/basic/errors.hpp"
#include "eligian/test_support/tree_builders.hpp"

using namespace eligian;
using namespace eligian::test_support;

// ============================================================================
// Well-formed trees
// ============================================================================

TEST(SyntaxTreeReaderTest, ReadsProgramSections)
{
  json tree = program(
    {default_import("styles", "./main.css"), named_import("intro", "./intro.html")},
    {action("fadeIn", {"selector"}, {call("selectElement", {param_ref("selector")})})},
    {timeline("main", "video", "#app", {at(t("0s"), t("5s"), call("fadeIn", {str("#a")}))}, "./v.mp4")});
  tree["languages"] = languages({language("en-US", "English", true)});

  AstContext ctx;
  const Program * prog = program_from_json(tree, ctx);

  ASSERT_NE(prog, nullptr);
  EXPECT_EQ(prog->uri, k_test_uri);
  ASSERT_EQ(prog->imports.size(), 2u);
  EXPECT_TRUE(isa<DefaultImportDecl>(prog->imports[0]));
  ASSERT_TRUE(isa<NamedImportDecl>(prog->imports[1]));
  EXPECT_FALSE(cast<NamedImportDecl>(prog->imports[1])->assetType.has_value());

  ASSERT_EQ(prog->actions.size(), 1u);
  EXPECT_EQ(prog->actions[0]->name, "fadeIn");
  ASSERT_EQ(prog->actions[0]->params.size(), 1u);

  ASSERT_EQ(prog->timelines.size(), 1u);
  const TimelineDecl * tl = prog->timelines[0];
  EXPECT_EQ(tl->provider, TimelineProvider::Video);
  ASSERT_TRUE(tl->source.has_value());
  EXPECT_EQ(*tl->source, "./v.mp4");
  ASSERT_EQ(tl->events.size(), 1u);
  const auto * ev = dyn_cast<TimedEvent>(tl->events[0]);
  ASSERT_NE(ev, nullptr);
  ASSERT_NE(ev->call, nullptr);
  EXPECT_EQ(ev->call->name, "fadeIn");

  ASSERT_NE(prog->languages, nullptr);
  ASSERT_EQ(prog->languages->entries.size(), 1u);
  EXPECT_TRUE(prog->languages->entries[0]->isDefault);
}

TEST(SyntaxTreeReaderTest, BareExpressionIsPositionalArgument)
{
  AstContext ctx;
  const Program * prog = program_from_json(
    single_timeline({at_ops(t("0s"), t("1s"), {call("addClass", {str("a"), kwarg("x", num(1))})})}),
    ctx);

  const auto * ev = cast<TimedEvent>(prog->timelines[0]->events[0]);
  ASSERT_EQ(ev->startOps.size(), 1u);
  const OperationCall * c = ev->startOps[0];
  ASSERT_EQ(c->args.size(), 2u);
  EXPECT_FALSE(c->args[0]->name.has_value());
  ASSERT_TRUE(c->args[1]->name.has_value());
  EXPECT_EQ(*c->args[1]->name, "x");
}

TEST(SyntaxTreeReaderTest, ReadsRangesWhenPresent)
{
  json ev = at(t("0s"), t("1s"), call("log"));
  ev["range"] = {{"start", 10}, {"end", 24}};

  AstContext ctx;
  const Program * prog = program_from_json(single_timeline({ev}), ctx);
  const SourceRange r = prog->timelines[0]->events[0]->get_range();
  EXPECT_EQ(r.get_begin().get_offset(), 10u);
  EXPECT_EQ(r.get_end().get_offset(), 24u);
}

TEST(SyntaxTreeReaderTest, ProviderFromString)
{
  auto provider = JsonSyntaxTreeProvider::from_string(single_timeline({}).dump());
  AstContext ctx;
  const Program * prog = provider.provide(ctx);
  ASSERT_NE(prog, nullptr);
  EXPECT_EQ(prog->timelines.size(), 1u);
}

// ============================================================================
// Malformed trees
// ============================================================================

TEST(SyntaxTreeReaderTest, UnknownNodeTypeIsTransformError)
{
  AstContext ctx;
  json tree = single_timeline({node("ForLoop")});
  EXPECT_THROW((void)program_from_json(tree, ctx), TransformError);
}

TEST(SyntaxTreeReaderTest, MissingRequiredFieldIsTransformError)
{
  AstContext ctx;
  json ev = at(t("0s"), t("1s"), call("log"));
  ev.erase("start");
  EXPECT_THROW((void)program_from_json(single_timeline({ev}), ctx), TransformError);
}

TEST(SyntaxTreeReaderTest, TimedEventNeedsExactlyOneOfEndAndDuration)
{
  AstContext ctx;
  json both = at(t("0s"), t("1s"), call("log"));
  both["duration"] = t("1s");
  EXPECT_THROW((void)program_from_json(single_timeline({both}), ctx), TransformError);

  json neither = at(t("0s"), t("1s"), call("log"));
  neither.erase("end");
  EXPECT_THROW((void)program_from_json(single_timeline({neither}), ctx), TransformError);
}

TEST(SyntaxTreeReaderTest, WrongValueTypeIsTransformError)
{
  AstContext ctx;
  json tree = single_timeline({});
  tree["timelines"][0]["loop"] = "yes";
  EXPECT_THROW((void)program_from_json(tree, ctx), TransformError);
}

TEST(SyntaxTreeReaderTest, InvalidJsonTextIsTransformError)
{
  EXPECT_THROW((void)JsonSyntaxTreeProvider::from_string("{\"type\": "), TransformError);
}

TEST(SyntaxTreeReaderTest, RootMustBeProgram)
{
  AstContext ctx;
  EXPECT_THROW((void)program_from_json(t("1s"), ctx), TransformError);
}
