#pragma once

#include <cstddef>
#include <string_view>

namespace boxscan::match {

/// Levenshtein distance (insert, delete, substitute; unit costs) over bytes.
[[nodiscard]] std::size_t levenshtein(std::string_view a, std::string_view b);

/// 100 * (1 - distance / max(len)) in [0, 100]; two empty strings give 100.
[[nodiscard]] double similarity_percent(std::string_view a, std::string_view b);

/// Length in bytes of the shared prefix.
[[nodiscard]] std::size_t common_prefix(std::string_view a, std::string_view b) noexcept;

}  // namespace boxscan::match
