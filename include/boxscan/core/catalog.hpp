#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace boxscan::core {

/// Canonical drug record. Brand aliases resolve to this (generic) entry.
struct CatalogEntry {
  std::uint64_t id{0};
  std::string canonical_name;
  std::string generic_name;
  std::vector<std::string> brand_aliases;  // ordered, no duplicates
  std::string category;                    // e.g. "analgesic", "antibiotic"
  std::string atc_code;
  std::vector<std::string> search_keys;    // normalized
  std::uint64_t usage_count{0};
};

/// Read-only drug catalog as seen by the matching pipeline.
/// Implementations must allow concurrent calls from scan workers.
class ICatalogStore {
 public:
  virtual ~ICatalogStore() = default;

  /// Entries whose name, alias or search key normalizes to \p normalized_key.
  [[nodiscard]] virtual std::vector<CatalogEntry> lookup_by_key(
      std::string_view normalized_key) const = 0;

  [[nodiscard]] virtual std::vector<CatalogEntry> list_by_category(
      std::string_view category) const = 0;

  /// Every entry, in insertion order.
  [[nodiscard]] virtual std::vector<CatalogEntry> list_all() const = 0;

  /// All category names, sorted.
  [[nodiscard]] virtual std::vector<std::string> categories() const = 0;
};

}  // namespace boxscan::core
