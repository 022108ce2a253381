// eligian/basic/string_distance.cpp - Edit distance implementation
//
#include "eligian/basic/string_distance.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace eligian
{

size_t levenshtein_distance(std::string_view a, std::string_view b)
{
  if (a.size() < b.size()) std::swap(a, b);

  // Single row of the DP matrix, indexed by position in the shorter string
  std::vector<size_t> row(b.size() + 1);
  std::iota(row.begin(), row.end(), size_t{0});

  for (size_t i = 1; i <= a.size(); ++i) {
    size_t diag = row[0];
    row[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t above = row[j];
      const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      row[j] = std::min({row[j] + 1, row[j - 1] + 1, diag + cost});
      diag = above;
    }
  }
  return row[b.size()];
}

std::optional<std::string> nearest_match(
  std::string_view name, const std::vector<std::string> & candidates, size_t max_distance)
{
  std::optional<std::string> best;
  size_t best_distance = max_distance + 1;
  for (const auto & candidate : candidates) {
    const size_t d = levenshtein_distance(name, candidate);
    if (d < best_distance) {
      best = candidate;
      best_distance = d;
    }
  }
  return best;
}

std::vector<std::string> similar_names(
  std::string_view name, const std::vector<std::string> & candidates, size_t max_count,
  size_t max_distance)
{
  std::vector<std::pair<size_t, const std::string *>> scored;
  for (const auto & candidate : candidates) {
    const size_t d = levenshtein_distance(name, candidate);
    if (d <= max_distance) {
      scored.emplace_back(d, &candidate);
    }
  }
  std::stable_sort(scored.begin(), scored.end(), [](const auto & lhs, const auto & rhs) {
    return lhs.first < rhs.first;
  });

  std::vector<std::string> out;
  for (size_t i = 0; i < scored.size() && i < max_count; ++i) {
    out.push_back(*scored[i].second);
  }
  return out;
}

}  // namespace eligian
