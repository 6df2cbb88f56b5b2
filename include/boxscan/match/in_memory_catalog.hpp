#pragma once

#include <boxscan/core/catalog.hpp>
#include <boxscan/core/correction.hpp>
#include <boxscan/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace boxscan::match {

/// Catalog held in memory. Reads take a shared lock, so scans can run while
/// the owner absorbs corrections.
///
/// File format, one entry per line, '#' starts a comment:
///   canonical|generic|brand1,brand2|category|atc|usage_count
/// Trailing fields may be omitted.
class InMemoryCatalog : public core::ICatalogStore {
 public:
  InMemoryCatalog() = default;

  /// Add an entry; id and search keys are assigned here. Returns its id.
  std::uint64_t add(core::CatalogEntry entry);

  /// Load entries from a catalog file. Returns the number of entries added.
  [[nodiscard]] std::expected<std::size_t, core::ScanError> load_file(
      const std::string& path);

  /// Apply a user correction: the observed text becomes an extra search key of
  /// the corrected entry and its usage count goes up. Rejections are ignored.
  /// NoMatchFound when the corrected name is not in the catalog.
  [[nodiscard]] std::expected<void, core::ScanError> absorb(
      const core::CorrectionRecord& record);

  [[nodiscard]] std::vector<core::CatalogEntry> lookup_by_key(
      std::string_view normalized_key) const override;

  [[nodiscard]] std::vector<core::CatalogEntry> list_by_category(
      std::string_view category) const override;

  [[nodiscard]] std::vector<core::CatalogEntry> list_all() const override;

  [[nodiscard]] std::vector<std::string> categories() const override;

  [[nodiscard]] std::size_t size() const;

 private:
  [[nodiscard]] core::CatalogEntry* find_by_name(std::string_view normalized_name);

  mutable std::shared_mutex mutex_;
  std::vector<core::CatalogEntry> entries_;
  std::uint64_t next_id_{1};
};

}  // namespace boxscan::match
