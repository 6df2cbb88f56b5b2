#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/match_candidate.hpp>
#include <boxscan/core/region.hpp>
#include <boxscan/core/region_result.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace boxscan::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
/// Invoked from scan worker threads, so it must be thread-safe.
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Working state of one region while it moves through the stages.
struct RegionContext {
  const Region& region;
  std::stop_token stop;
  RegionResult result;

  std::string match_text;                // extracted or recovered text
  std::optional<int> confidence_cap;     // set when matching on recovered text
  bool extraction_failed{false};
  std::vector<MatchCandidate> candidates;
};

/// One per-region step (extraction, visual lookup, recovery, matching, decision).
/// A stage records per-region failures on ctx.result and returns success;
/// returning an error other than Cancelled is logged and the region continues.
class IRegionStage {
 public:
  virtual ~IRegionStage() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, ScanError> process(RegionContext& ctx) = 0;
};

/// Runs the stages in order on one region and returns its RegionResult.
class RegionPipeline {
 public:
  RegionPipeline() = default;

  void add_stage(std::unique_ptr<IRegionStage> stage);

  /// Returns Cancelled when \p stop is requested before the region finishes,
  /// InvalidConfig when no stage is registered.
  /// Thread-safe: run() may be called for different regions concurrently as
  /// long as the stages are.
  [[nodiscard]] std::expected<RegionResult, ScanError> run(
      const Region& region,
      std::stop_token stop = {},
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept { return stages_.size(); }

 private:
  std::vector<std::unique_ptr<IRegionStage>> stages_;
};

}  // namespace boxscan::core
