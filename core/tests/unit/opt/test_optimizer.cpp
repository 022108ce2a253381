// tests/unit/opt/test_optimizer.cpp - Removal of unschedulable timeline actions
//

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "eligian/codegen/json_emitter.hpp"
#include "eligian/opt/optimizer.hpp"
#include "eligian/test_support/tree_builders.hpp"

using namespace eligian;
using namespace eligian::test_support;

namespace
{

ir::TimelineAction span(double start, double end)
{
  ir::TimelineAction action;
  action.duration = {start, end};
  return action;
}

std::vector<std::string> action_ids(const ir::ConfigIR & config)
{
  std::vector<std::string> ids;
  for (const auto & timeline : config.timelines) {
    for (const auto & action : timeline.actions) {
      ids.push_back(action.id);
    }
  }
  return ids;
}

}  // namespace

// ============================================================================
// is_schedulable
// ============================================================================

TEST(OptimizerTest, SchedulableIntervals)
{
  EXPECT_TRUE(is_schedulable(span(0, 5)));
  EXPECT_TRUE(is_schedulable(span(1.5, 1.75)));
  EXPECT_FALSE(is_schedulable(span(5, 2))) << "end before start";
  EXPECT_FALSE(is_schedulable(span(3, 3))) << "empty interval";
  EXPECT_FALSE(is_schedulable(span(-1, 5))) << "negative start";

  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(is_schedulable(span(nan, 5))) << "NaN is left for the emitter";
  EXPECT_TRUE(is_schedulable(span(0, nan)));
}

// ============================================================================
// optimize
// ============================================================================

TEST(OptimizerTest, DropsUnschedulableActionsKeepingOrder)
{
  const auto doc = lower_tree(single_timeline({
    at(t("0s"), t("5s"), call("log")),
    at(t("5s"), t("2s"), call("log")),
    at(time_op(t("0s"), "-", t("1s")), t("5s"), call("log")),
    at(t("6s"), t("7s"), call("log")),
  }));

  const ir::ConfigIR optimized = optimize(doc.config);

  EXPECT_EQ(
    action_ids(optimized),
    (std::vector<std::string>{"timeline-0-main-action-0", "timeline-0-main-action-3"}))
    << "survivors keep their ids";
  EXPECT_EQ(doc.config.timelines[0].actions.size(), 4u) << "input is not modified";
}

TEST(OptimizerTest, Idempotent)
{
  const auto doc = lower_tree(single_timeline({
    at(t("0s"), t("1s"), call("log")),
    at(t("3s"), t("1s"), call("log")),
    sequence({step(call("log"), t("0s")), step(call("log"), t("2s"))}),
  }));

  const ir::ConfigIR once = optimize(doc.config);
  const ir::ConfigIR twice = optimize(once);

  EXPECT_EQ(action_ids(once), action_ids(twice));
  EXPECT_EQ(emit(once), emit(twice));
}

TEST(OptimizerTest, ActionDefinitionsAndStaggerGroupsUntouched)
{
  const auto doc = lower_tree(program(
    {}, {action("fadeIn", {}, {call("log")})},
    {timeline(
      "main", "raf", "#app",
      {stagger(t("0s"), array({str(".a"), str(".b")}), t("1s"), call("selectElement"))})}));

  const ir::ConfigIR optimized = optimize(doc.config);

  ASSERT_EQ(optimized.actions.size(), 1u);
  EXPECT_EQ(optimized.actions[0].start_operations.size(), 1u);
  EXPECT_EQ(optimized.timelines[0].stagger_groups.size(), 1u);
}
