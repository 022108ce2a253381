// eligian/basic/string_distance.hpp - Edit distance and "did you mean" lookup
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eligian
{

/// Maximum edit distance for a suggestion to be offered.
inline constexpr size_t k_suggestion_distance = 2;

/// Levenshtein distance (insertions, deletions, substitutions all cost 1).
[[nodiscard]] size_t levenshtein_distance(std::string_view a, std::string_view b);

/**
 * Closest candidate within `max_distance` of `name`.
 * Ties go to the candidate that comes first.
 */
[[nodiscard]] std::optional<std::string> nearest_match(
  std::string_view name, const std::vector<std::string> & candidates,
  size_t max_distance = k_suggestion_distance);

/**
 * Up to `max_count` candidates within `max_distance` of `name`, closest
 * first. Equal distances keep candidate order.
 */
[[nodiscard]] std::vector<std::string> similar_names(
  std::string_view name, const std::vector<std::string> & candidates, size_t max_count,
  size_t max_distance = k_suggestion_distance);

}  // namespace eligian
