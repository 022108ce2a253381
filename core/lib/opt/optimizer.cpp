// eligian/opt/optimizer.cpp - IR cleanup before emission
//
#include "eligian/opt/optimizer.hpp"

#include <algorithm>

namespace eligian
{

bool is_schedulable(const ir::TimelineAction & action) noexcept
{
  const auto & d = action.duration;
  return !(d.end <= d.start) && !(d.start < 0);
}

ir::ConfigIR optimize(const ir::ConfigIR & config)
{
  ir::ConfigIR out = config;
  for (auto & timeline : out.timelines) {
    auto & actions = timeline.actions;
    actions.erase(
      std::remove_if(
        actions.begin(), actions.end(), [](const auto & a) { return !is_schedulable(a); }),
      actions.end());
  }
  return out;
}

}  // namespace eligian
