// eligian/opt/optimizer.hpp - IR cleanup before emission
//
#pragma once

#include "eligian/ir/ir.hpp"

namespace eligian
{

/**
 * Remove timeline actions that can never run.
 *
 * An action is dropped when `end <= start` or `start < 0`. Comparisons with
 * NaN are false, so an action with a NaN bound is kept and left for the
 * emitter to reject.
 *
 * The result keeps the order and ids of the surviving actions; action
 * definitions are copied unchanged. `optimize(optimize(c))` equals
 * `optimize(c)`.
 */
[[nodiscard]] ir::ConfigIR optimize(const ir::ConfigIR & config);

/// True if `optimize` keeps this action
[[nodiscard]] bool is_schedulable(const ir::TimelineAction & action) noexcept;

}  // namespace eligian
