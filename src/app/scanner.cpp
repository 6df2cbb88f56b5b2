#include <boxscan/app/scanner.hpp>
#include "region_stages.hpp"
#include <boxscan/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <variant>

namespace boxscan::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

Scanner::Scanner(ScannerComponents components) : components_(std::move(components)) {
  if (!components_.detector || !components_.extractor || !components_.features ||
      !components_.catalog) {
    throw std::invalid_argument("Scanner: detector, extractor, features and catalog are required");
  }
  pipeline_.add_stage(std::make_unique<detail::ExtractionStage>(components_.extractor));
  pipeline_.add_stage(std::make_unique<detail::VisualStage>(
      components_.features, components_.visual_store, components_.visual_k));
  pipeline_.add_stage(std::make_unique<detail::RecoveryStage>(
      std::make_shared<match::RecoveryEngine>(components_.catalog, components_.recovery)));
  pipeline_.add_stage(std::make_unique<detail::MatchStage>(
      std::make_shared<match::MatchEngine>(components_.catalog, components_.match)));
  pipeline_.add_stage(
      std::make_unique<detail::DecisionStage>(match::DecisionEngine(components_.decision)));
}

std::expected<core::MultiDrugResult, core::ScanError> Scanner::process(
    const core::Image& image, core::ScanSession& session,
    core::StageTimingCallback* timing_cb) const {
  const std::stop_token stop = session.begin_scan();
  const auto started = std::chrono::steady_clock::now();

  auto regions = components_.detector->detect(image);
  if (!regions) {
    core::log_error("scanner") << "session " << session.id() << ": detection failed ("
                               << core::to_string(regions.error()) << ")";
    return std::unexpected(core::ScanError::DetectionFailure);
  }

  const std::size_t n = regions->size();
  // One slot per region: results land in region order whatever finishes first.
  std::vector<std::optional<core::RegionResult>> slots(n);
  std::atomic<std::size_t> cancelled{0};

  auto run_one = [&](std::size_t idx) {
    const core::Region& region = (*regions)[idx];
    auto result = pipeline_.run(region, stop, timing_cb);
    if (result) {
      slots[idx] = std::move(*result);
    } else if (result.error() == core::ScanError::Cancelled) {
      ++cancelled;
    } else {
      core::log_error("scanner") << "region " << region.id << ": "
                                 << core::to_string(result.error());
      core::RegionResult failed;
      failed.region_id = region.id;
      failed.bbox = region.bbox;
      failed.detection_confidence = region.detection_confidence;
      failed.errors.push_back(result.error());
      slots[idx] = std::move(failed);
    }
  };

  const std::size_t workers = std::min(effective_workers(components_.worker_count), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) run_one(i);
  } else {
    std::queue<std::size_t> index_queue;
    for (std::size_t i = 0; i < n; ++i) {
      index_queue.push(i);
    }
    std::mutex queue_mutex;

    auto worker = [&]() {
      while (true) {
        std::size_t idx;
        {
          std::lock_guard lock(queue_mutex);
          if (index_queue.empty()) break;
          idx = index_queue.front();
          index_queue.pop();
        }
        run_one(idx);
      }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
    for (auto& t : threads) {
      t.join();
    }
  }

  std::vector<core::RegionResult> finished;
  finished.reserve(n);
  for (auto& slot : slots) {
    if (slot) finished.push_back(std::move(*slot));
  }

  match::AggregationInput input;
  input.session_id = session.id();
  input.source = session.source();
  input.started = started;
  input.cancelled_regions = cancelled.load();
  core::MultiDrugResult result = aggregator_.aggregate(std::move(finished), input);

  core::log_info("scanner") << "session " << session.id() << ": " << n << " regions, "
                            << result.drug_names.size() << " drugs, "
                            << input.cancelled_regions << " cancelled, "
                            << result.duration.count() << " ms";
  session.record(result);
  return result;
}

std::expected<void, core::ScanError> Scanner::apply_correction(
    const core::ScanSession& session, std::size_t region_id, std::string corrected_name,
    core::CorrectionKind kind) const {
  const auto last = session.last_result();
  if (!last) {
    return std::unexpected(core::ScanError::InvalidInput);
  }
  const core::RegionResult* region = last->find_region(region_id);
  if (region == nullptr) {
    return std::unexpected(core::ScanError::InvalidInput);
  }

  core::CorrectionRecord record;
  record.session_id = session.id();
  record.region_id = region_id;
  record.previous_name = region->best ? region->best->drug_name : std::string{};
  if (region->extracted) {
    record.observed_text = region->extracted->raw_text;
  }

  if (std::holds_alternative<core::VerificationConfirmed>(kind) && corrected_name.empty()) {
    corrected_name = record.previous_name;
  }
  if (corrected_name.empty() && !std::holds_alternative<core::Rejected>(kind)) {
    return std::unexpected(core::ScanError::InvalidInput);
  }
  record.corrected_name = std::move(corrected_name);
  record.kind = kind;
  record.features = region->features;
  record.created_at = std::chrono::system_clock::now();

  std::vector<std::shared_ptr<core::ICorrectionSink>> sinks;
  {
    std::lock_guard lock(sinks_mutex_);
    sinks = sinks_;
  }
  core::log_info("scanner") << "correction " << core::correction_kind_name(kind) << " region "
                            << region_id << ": '" << record.previous_name
                            << "' -> '" << record.corrected_name << "'";
  for (const auto& sink : sinks) {
    sink->submit(record);
  }
  return {};
}

void Scanner::add_correction_sink(std::shared_ptr<core::ICorrectionSink> sink) {
  if (!sink) return;
  std::lock_guard lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

}  // namespace boxscan::app
