// eligian/sema/time_evaluator.hpp - Time literal and time expression evaluation
//
#pragma once

#include <string_view>

#include "eligian/ast/ast.hpp"

namespace eligian
{

/**
 * Evaluate time-literal text to seconds.
 *
 * Accepts `<digits>[.<digits>](s|ms)`. Any other text evaluates to 0.
 *
 * @code
 *   evaluate_time("5s");     // 5.0
 *   evaluate_time("500ms");  // 0.5
 *   evaluate_time("5m");     // 0.0
 * @endcode
 */
[[nodiscard]] double evaluate_time(std::string_view text) noexcept;

/**
 * Folds time expressions to seconds.
 *
 * Relative times (`+2s`) are resolved against the cursor, which the caller
 * keeps at the end of the previous action of the timeline.
 */
class TimeEvaluator
{
public:
  explicit TimeEvaluator(double cursor = 0.0) : cursor_(cursor) {}

  [[nodiscard]] double cursor() const noexcept { return cursor_; }
  void set_cursor(double cursor) noexcept { cursor_ = cursor; }

  /**
   * Evaluate a time expression.
   *
   * @throws TransformError if the expression is missing or refers to a
   *         runtime property
   */
  [[nodiscard]] double evaluate(const TimeExpr * expr) const;

private:
  double cursor_;
};

}  // namespace eligian
