#pragma once

#include <boxscan/core/correction.hpp>
#include <boxscan/index/feature_similarity.hpp>
#include <boxscan/index/visual_catalog_store.hpp>
#include <cstddef>
#include <expected>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace boxscan::index {

/// One reference image of a known drug box.
struct StoredImage {
  std::string image_ref;
  std::string drug_name;
  std::vector<core::FeatureVector> features;
};

struct FeatureIndexConfig {
  FeatureWeights weights;
  float similarity_floor{0.75f};      // nearest() drops anything below
  float agreement_threshold{0.8f};    // per-type agreement
  float duplicate_threshold{0.95f};   // optimize() dedup, same drug only
};

/// In-process visual catalog with reader-writer locking.
///
/// Readers (nearest, size, save) take the shared lock. New images go to a
/// pending queue guarded by its own mutex, so staging never waits on scans;
/// optimize() takes the exclusive lock to merge them.
///
/// File format, one vector per line:
///   image_ref|drug_name|type|confidence|v1,v2,...
/// Lines sharing image_ref form one StoredImage.
class FeatureIndex : public IVisualCatalogStore {
 public:
  explicit FeatureIndex(FeatureIndexConfig config = {});

  /// Add directly, bypassing the pending queue. Used when loading.
  void add(StoredImage image);

  /// Queue an image for the next optimize().
  void stage(StoredImage image);

  /// Stage the region's features under the corrected name. Rejections and
  /// records without features are ignored.
  void absorb(const core::CorrectionRecord& record);

  [[nodiscard]] std::expected<std::vector<core::VisualMatch>, core::ScanError> nearest(
      std::span<const core::FeatureVector> features, std::size_t k) const override;

  [[nodiscard]] std::expected<OptimizeReport, core::ScanError> optimize() override;

  [[nodiscard]] std::expected<std::size_t, core::ScanError> load_file(const std::string& path);
  [[nodiscard]] std::expected<void, core::ScanError> save(const std::string& path) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t pending_count() const;
  [[nodiscard]] const FeatureIndexConfig& config() const noexcept { return config_; }

 private:
  FeatureIndexConfig config_;

  mutable std::shared_mutex mutex_;
  std::vector<StoredImage> images_;

  mutable std::mutex pending_mutex_;
  std::vector<StoredImage> pending_;
};

}  // namespace boxscan::index
