// eligian/sema/time_evaluator.cpp - Time evaluation implementation
//
#include "eligian/sema/time_evaluator.hpp"

#include <charconv>
#include <regex>
#include <string>

#include "eligian/basic/casting.hpp"
#include "eligian/basic/errors.hpp"

namespace eligian
{

namespace
{

const std::regex & time_literal_pattern()
{
  static const std::regex pattern(R"(^(\d+(?:\.\d+)?)(s|ms)$)");
  return pattern;
}

std::string property_path(const TimeRefExpr * ref)
{
  std::string path(ref->scope);
  for (const auto prop : ref->properties) {
    path += '.';
    path += prop;
  }
  return path;
}

}  // namespace

double evaluate_time(std::string_view text) noexcept
{
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_match(text.begin(), text.end(), match, time_literal_pattern())) {
    return 0.0;
  }

  const char * const begin = text.data() + match.position(1);
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(begin, begin + match.length(1), value);
  if (ec != std::errc{} || ptr != begin + match.length(1)) {
    return 0.0;
  }
  return match[2] == "ms" ? value / 1000.0 : value;
}

double TimeEvaluator::evaluate(const TimeExpr * expr) const
{
  if (expr == nullptr) {
    throw TransformError("missing time expression");
  }

  if (const auto * lit = dyn_cast<TimeLiteral>(expr)) {
    return evaluate_time(lit->text);
  }

  if (const auto * rel = dyn_cast<RelativeTime>(expr)) {
    return cursor_ + evaluate(rel->offset);
  }

  if (const auto * bin = dyn_cast<BinaryTimeExpr>(expr)) {
    const double lhs = evaluate(bin->lhs);
    const double rhs = evaluate(bin->rhs);
    switch (bin->op) {
      case TimeOp::Add:
        return lhs + rhs;
      case TimeOp::Sub:
        return lhs - rhs;
      case TimeOp::Mul:
        return lhs * rhs;
      case TimeOp::Div:
        // IEEE semantics; the emitter rejects the resulting non-finite value
        return lhs / rhs;
    }
  }

  if (const auto * ref = dyn_cast<TimeRefExpr>(expr)) {
    throw TransformError(
      "time expression must be constant, found property reference '" + property_path(ref) + "'",
      ref->get_range());
  }

  throw TransformError("unsupported time expression", expr->get_range());
}

}  // namespace eligian
