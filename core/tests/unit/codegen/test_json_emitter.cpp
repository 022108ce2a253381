// tests/unit/codegen/test_json_emitter.cpp - Eligius configuration output
//

#include <gtest/gtest.h>

#include <limits>

#include "eligian/basic/errors.hpp"
#include "eligian/codegen/json_emitter.hpp"
#include "eligian/test_support/tree_builders.hpp"

using namespace eligian;
using namespace eligian::test_support;
using nlohmann::ordered_json;

namespace
{

ordered_json emitted(const json & tree)
{
  return JsonEmitter().to_json(lower_tree(tree).config);
}

std::vector<std::string> keys_of(const ordered_json & object)
{
  std::vector<std::string> keys;
  for (const auto & item : object.items()) {
    keys.push_back(item.key());
  }
  return keys;
}

}  // namespace

// ============================================================================
// Document shape
// ============================================================================

TEST(JsonEmitterTest, TopLevelKeysInSchemaOrder)
{
  const auto doc = emitted(single_timeline({at(t("0s"), t("1s"), call("log"))}));

  EXPECT_EQ(
    keys_of(doc),
    (std::vector<std::string>{
      "$schema", "id", "engine", "containerSelector", "language", "layoutTemplate",
      "availableLanguages", "labels", "initActions", "actions", "eventActions", "timelines"}));
  EXPECT_EQ(doc["$schema"], k_eligius_schema_url);
  EXPECT_EQ(doc["engine"]["systemName"], "Eligius");
  EXPECT_EQ(doc["containerSelector"], "#app");
  EXPECT_EQ(doc["language"], "en-US");
  EXPECT_TRUE(doc["layoutTemplate"].is_null());
  EXPECT_EQ(doc["id"].get<std::string>().size(), 16u);
}

TEST(JsonEmitterTest, LayoutAndLanguages)
{
  json tree = single_timeline(
    {at(t("0s"), t("1s"), call("log"))}, {default_import("layout", "./layout.html")});
  tree["languages"] = languages({language("en-US", "English"), language("nl-NL", "Nederlands", true)});

  const auto doc = emitted(tree);

  EXPECT_EQ(doc["layoutTemplate"], "./layout.html");
  EXPECT_EQ(doc["language"], "nl-NL") << "the default entry wins";
  ASSERT_EQ(doc["availableLanguages"].size(), 2u);
  EXPECT_EQ(doc["availableLanguages"][0]["code"], "en-US");
  EXPECT_EQ(doc["availableLanguages"][1]["label"], "Nederlands");
}

TEST(JsonEmitterTest, TimelineShape)
{
  const auto doc = emitted(program(
    {}, {},
    {timeline(
      "intro", "video", "#stage",
      {at(t("1s"), t("2.5s"), call("log")), at(t("3s"), t("4s"), call("log"))}, "./intro.mp4")}));

  const auto & tl = doc["timelines"][0];
  EXPECT_EQ(
    keys_of(tl),
    (std::vector<std::string>{"id", "uri", "type", "duration", "loop", "selector", "timelineActions"}));
  EXPECT_EQ(tl["id"], "timeline-0-intro");
  EXPECT_EQ(tl["uri"], "./intro.mp4");
  EXPECT_EQ(tl["type"], "video");
  EXPECT_EQ(tl["duration"], 4) << "largest action end";
  EXPECT_EQ(tl["loop"], false);

  const auto & action = tl["timelineActions"][0];
  EXPECT_EQ(
    keys_of(action),
    (std::vector<std::string>{"id", "name", "duration", "startOperations", "endOperations"}));
  EXPECT_EQ(action["duration"]["start"], 1);
  EXPECT_EQ(action["duration"]["end"], 2.5);
}

TEST(JsonEmitterTest, EmptyTimelineHasZeroDuration)
{
  const auto doc = emitted(program({}, {}, {timeline("main", "raf", "#app", {})}));

  EXPECT_EQ(doc["timelines"][0]["duration"], 0);
  EXPECT_TRUE(doc["timelines"][0]["uri"].is_null());
  EXPECT_TRUE(doc["timelines"][0]["timelineActions"].empty());
}

// ============================================================================
// Operations
// ============================================================================

TEST(JsonEmitterTest, OperationDataNamedAfterParameters)
{
  const auto doc = emitted(single_timeline({at_ops(
    t("0s"), t("1s"),
    {call("selectElement", {str("#a")}),
     call("animate", {object({{"opacity", num(1)}}), num(500), str("ease"), str("extra")}),
     call("createElement", {kwarg("elementName", str("div"))})})}));

  const auto & ops = doc["timelines"][0]["timelineActions"][0]["startOperations"];
  ASSERT_EQ(ops.size(), 3u);

  EXPECT_EQ(ops[0]["id"], "timeline-0-main-action-0-start-0");
  EXPECT_EQ(ops[0]["systemName"], "selectElement");
  EXPECT_EQ(ops[0]["operationData"]["selector"], "#a");

  const auto & animate = ops[1]["operationData"];
  EXPECT_EQ(animate["animationProperties"]["opacity"], 1);
  EXPECT_EQ(animate["animationDuration"], 500);
  EXPECT_EQ(animate["animationEasing"], "ease");
  EXPECT_EQ(animate["arg3"], "extra") << "arguments past the signature are numbered";

  EXPECT_EQ(ops[2]["operationData"]["elementName"], "div");
  EXPECT_EQ(ops[2]["id"], "timeline-0-main-action-0-start-2");
}

TEST(JsonEmitterTest, ActionCallsBecomeRequestAndStart)
{
  const auto doc = emitted(program(
    {},
    {action("fadeIn", {"selector"}, {call("selectElement", {param_ref("selector")})}, {}, true)},
    {timeline("main", "raf", "#app", {at(t("0s"), t("2s"), call("fadeIn", {str("#title")}))})}));

  const auto & def = doc["actions"][0];
  EXPECT_EQ(def["id"], "action-0-fadeIn");
  EXPECT_EQ(def["name"], "fadeIn");
  EXPECT_EQ(def["startOperations"][0]["id"], "action-0-fadeIn-start-0");

  const auto & action = doc["timelines"][0]["timelineActions"][0];
  const auto & start = action["startOperations"];
  ASSERT_EQ(start.size(), 2u);
  EXPECT_EQ(start[0]["systemName"], "requestAction");
  EXPECT_EQ(start[0]["operationData"]["systemName"], "fadeIn");
  EXPECT_EQ(start[1]["systemName"], "startAction");
  EXPECT_EQ(start[1]["operationData"]["actionOperationData"]["selector"], "#title");

  const auto & end = action["endOperations"];
  ASSERT_EQ(end.size(), 2u) << "endable action is ended with the interval";
  EXPECT_EQ(end[0]["systemName"], "requestAction");
  EXPECT_EQ(end[1]["systemName"], "endAction");
  EXPECT_EQ(end[1]["id"], "timeline-0-main-action-0-end-1");
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JsonEmitterTest, OutputIsByteIdentical)
{
  const json tree = program(
    {default_import("layout", "./layout.html")}, {action("pulse", {}, {call("log", {str("x")})})},
    {timeline(
      "main", "raf", "#app",
      {at(t("0s"), t("1s"), call("pulse")),
       at_ops(t("1s"), t("2s"), {call("setStyle", {object({{"b", num(2)}, {"a", num(1)}})})})})});

  const auto first = lower_tree(tree);
  const auto second = lower_tree(tree);

  EXPECT_EQ(emit(first.config), emit(second.config));
  EXPECT_EQ(emit(first.config), emit(first.config));
}

TEST(JsonEmitterTest, IndentOption)
{
  const auto doc = lower_tree(single_timeline({at(t("0s"), t("1s"), call("log"))}));

  const std::string pretty = emit(doc.config, EmitOptions{4});
  const std::string compact = emit(doc.config, EmitOptions{0});

  EXPECT_NE(pretty.find("\n    \"id\""), std::string::npos);
  EXPECT_EQ(compact.find('\n'), std::string::npos);
  EXPECT_EQ(ordered_json::parse(pretty), ordered_json::parse(compact));
}

TEST(JsonEmitterTest, NonFiniteNumberNamesField)
{
  auto doc = lower_tree(single_timeline({
    at(t("0s"), t("1s"), call("log")),
    at(t("1s"), t("2s"), call("log")),
  }));
  doc.config.timelines[0].actions[1].duration.end = std::numeric_limits<double>::quiet_NaN();

  try {
    (void)emit(doc.config);
    FAIL() << "expected EmitError";
  } catch (const EmitError & e) {
    EXPECT_EQ(e.field_path(), "timelines[0].timelineActions[1].duration.end");
  }
}

TEST(JsonEmitterTest, NonFiniteArgumentNamesField)
{
  auto doc = lower_tree(single_timeline({at(t("0s"), t("1s"), call("wait", {num(1)}))}));
  auto & op = std::get<ir::RawOperation>(doc.config.timelines[0].actions[0].operations[0]);
  op.args[0].value = std::numeric_limits<double>::infinity();

  try {
    (void)emit(doc.config);
    FAIL() << "expected EmitError";
  } catch (const EmitError & e) {
    EXPECT_EQ(
      e.field_path(), "timelines[0].timelineActions[0].startOperations[0].operationData.milliseconds");
  }
}
