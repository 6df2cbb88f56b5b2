#pragma once

#include <boxscan/core/feature_vector.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace boxscan::core {

/// User replaced the recognized name with another one.
struct NameEdit {};
/// User confirmed the recognized name.
struct VerificationConfirmed {};
/// User marked the detection as wrong without naming a drug.
struct Rejected {};

using CorrectionKind = std::variant<NameEdit, VerificationConfirmed, Rejected>;

[[nodiscard]] std::string_view correction_kind_name(const CorrectionKind& kind) noexcept;

/// Calibration input forwarded to the catalog and feature-store owners.
struct CorrectionRecord {
  std::string session_id;
  std::size_t region_id{0};
  std::string observed_text;   // text the pipeline matched on
  std::string previous_name;   // pipeline's best guess, may be empty
  std::string corrected_name;
  CorrectionKind kind{NameEdit{}};
  std::vector<FeatureVector> features;
  std::chrono::system_clock::time_point created_at{};
};

/// Receiver of correction records. submit() may be called from any thread.
class ICorrectionSink {
 public:
  virtual ~ICorrectionSink() = default;
  virtual void submit(CorrectionRecord record) = 0;
};

/// FIFO of pending corrections; the owner drains it on its own schedule.
class CorrectionQueue : public ICorrectionSink {
 public:
  void submit(CorrectionRecord record) override;

  /// Remove and return everything queued so far, oldest first.
  [[nodiscard]] std::vector<CorrectionRecord> drain();

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::deque<CorrectionRecord> pending_;
};

}  // namespace boxscan::core
