#pragma once

#include <boxscan/core/region_pipeline.hpp>
#include <boxscan/index/visual_catalog_store.hpp>
#include <boxscan/match/decision_engine.hpp>
#include <boxscan/match/match_engine.hpp>
#include <boxscan/match/recovery_engine.hpp>
#include <boxscan/vision/feature_extractor.hpp>
#include <boxscan/vision/text_extractor.hpp>
#include <cstddef>
#include <memory>

namespace boxscan::app::detail {

/// Runs the recognizer. Failure marks the region for rescan but lets the
/// visual stage still run.
class ExtractionStage : public core::IRegionStage {
 public:
  explicit ExtractionStage(std::shared_ptr<const vision::TextExtractor> extractor);
  [[nodiscard]] std::string_view name() const noexcept override { return "extraction"; }
  [[nodiscard]] std::expected<void, core::ScanError> process(core::RegionContext& ctx) override;

 private:
  std::shared_ptr<const vision::TextExtractor> extractor_;
};

/// Feature extraction and visual catalog lookup. A null store skips lookup.
class VisualStage : public core::IRegionStage {
 public:
  VisualStage(std::shared_ptr<const vision::FeatureExtractor> features,
              std::shared_ptr<const index::IVisualCatalogStore> store, std::size_t k);
  [[nodiscard]] std::string_view name() const noexcept override { return "visual"; }
  [[nodiscard]] std::expected<void, core::ScanError> process(core::RegionContext& ctx) override;

 private:
  std::shared_ptr<const vision::FeatureExtractor> features_;
  std::shared_ptr<const index::IVisualCatalogStore> store_;
  std::size_t k_;
};

class RecoveryStage : public core::IRegionStage {
 public:
  explicit RecoveryStage(std::shared_ptr<const match::RecoveryEngine> engine);
  [[nodiscard]] std::string_view name() const noexcept override { return "recovery"; }
  [[nodiscard]] std::expected<void, core::ScanError> process(core::RegionContext& ctx) override;

 private:
  std::shared_ptr<const match::RecoveryEngine> engine_;
};

/// Catalog matching; applies the recovery confidence cap and marks
/// candidates confirmed by a visual match. Hits the extracted text earns
/// above the cap (an exact name on a worn box) are kept uncapped.
class MatchStage : public core::IRegionStage {
 public:
  explicit MatchStage(std::shared_ptr<const match::MatchEngine> engine);
  [[nodiscard]] std::string_view name() const noexcept override { return "match"; }
  [[nodiscard]] std::expected<void, core::ScanError> process(core::RegionContext& ctx) override;

 private:
  std::shared_ptr<const match::MatchEngine> engine_;
};

class DecisionStage : public core::IRegionStage {
 public:
  explicit DecisionStage(match::DecisionEngine engine);
  [[nodiscard]] std::string_view name() const noexcept override { return "decision"; }
  [[nodiscard]] std::expected<void, core::ScanError> process(core::RegionContext& ctx) override;

 private:
  match::DecisionEngine engine_;
};

}  // namespace boxscan::app::detail
