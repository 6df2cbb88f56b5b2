#include <boxscan/match/string_distance.hpp>
#include <algorithm>
#include <vector>

namespace boxscan::match {

std::size_t levenshtein(std::string_view a, std::string_view b) {
  if (a.size() < b.size()) std::swap(a, b);
  if (b.empty()) return a.size();

  // Two-row dynamic programming over the shorter string.
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

double similarity_percent(std::string_view a, std::string_view b) {
  const std::size_t max_len = std::max(a.size(), b.size());
  if (max_len == 0) return 100.0;
  const double d = static_cast<double>(levenshtein(a, b));
  return 100.0 * (1.0 - d / static_cast<double>(max_len));
}

std::size_t common_prefix(std::string_view a, std::string_view b) noexcept {
  const std::size_t n = std::min(a.size(), b.size());
  std::size_t i = 0;
  while (i < n && a[i] == b[i]) ++i;
  return i;
}

}  // namespace boxscan::match
