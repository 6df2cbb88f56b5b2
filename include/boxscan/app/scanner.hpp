#pragma once

#include <boxscan/core/catalog.hpp>
#include <boxscan/core/correction.hpp>
#include <boxscan/core/error.hpp>
#include <boxscan/core/image.hpp>
#include <boxscan/core/region_pipeline.hpp>
#include <boxscan/core/region_result.hpp>
#include <boxscan/core/session.hpp>
#include <boxscan/index/visual_catalog_store.hpp>
#include <boxscan/match/decision_engine.hpp>
#include <boxscan/match/match_engine.hpp>
#include <boxscan/match/recovery_engine.hpp>
#include <boxscan/match/result_aggregator.hpp>
#include <boxscan/vision/feature_extractor.hpp>
#include <boxscan/vision/region_detector.hpp>
#include <boxscan/vision/text_extractor.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace boxscan::app {

/// Everything a Scanner needs. visual_store may be null (no visual catalog).
struct ScannerComponents {
  std::shared_ptr<vision::RegionDetector> detector;
  std::shared_ptr<vision::TextExtractor> extractor;
  std::shared_ptr<vision::FeatureExtractor> features;
  std::shared_ptr<index::IVisualCatalogStore> visual_store;
  std::shared_ptr<const core::ICatalogStore> catalog;
  match::MatchConfig match;
  match::RecoveryConfig recovery;
  match::DecisionConfig decision;
  std::size_t worker_count{0};  // 0 = hardware concurrency
  std::size_t visual_k{10};
};

/// Multi-box scanner: detect regions, then run extraction, visual lookup,
/// recovery, matching and decision per region on a worker pool, then
/// aggregate.
///
/// process() may be called concurrently with different sessions.
class Scanner {
 public:
  /// \throws std::invalid_argument if detector, extractor, features or catalog is null.
  explicit Scanner(ScannerComponents components);

  /// Scan one photograph. Regions that observe session.request_rescan()
  /// before finishing are left out of the result. DetectionFailure when not
  /// even a fallback region could be built. If timing_cb is non-null it is
  /// invoked from worker threads with (stage_index, duration_ms) and must be
  /// thread-safe.
  [[nodiscard]] std::expected<core::MultiDrugResult, core::ScanError> process(
      const core::Image& image, core::ScanSession& session,
      core::StageTimingCallback* timing_cb = nullptr) const;

  /// Build a CorrectionRecord for a region of the session's last result and
  /// hand it to every registered sink. No in-process state changes.
  /// InvalidInput when there is no such result or region, or no name for a
  /// NameEdit. A VerificationConfirmed without a name confirms the current best.
  [[nodiscard]] std::expected<void, core::ScanError> apply_correction(
      const core::ScanSession& session, std::size_t region_id, std::string corrected_name,
      core::CorrectionKind kind) const;

  void add_correction_sink(std::shared_ptr<core::ICorrectionSink> sink);

  [[nodiscard]] std::size_t stage_count() const noexcept { return pipeline_.stage_count(); }

 private:
  ScannerComponents components_;
  core::RegionPipeline pipeline_;
  match::ResultAggregator aggregator_;

  mutable std::mutex sinks_mutex_;
  std::vector<std::shared_ptr<core::ICorrectionSink>> sinks_;
};

}  // namespace boxscan::app
