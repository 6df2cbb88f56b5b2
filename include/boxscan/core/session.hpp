#pragma once

#include <boxscan/core/region_result.hpp>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace boxscan::core {

/// Explicit scan session. The caller owns it and passes it into every
/// Scanner::process() call; there is no global "current session".
/// Thread-safety: request_rescan() may be called from any thread while a
/// scan is running.
class ScanSession {
 public:
  explicit ScanSession(std::string id, ImageSource source = ImageSource::Camera);

  ScanSession(const ScanSession&) = delete;
  ScanSession& operator=(const ScanSession&) = delete;

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] ImageSource source() const noexcept { return source_; }

  /// Start a new scan: resets the stop state and returns its token.
  [[nodiscard]] std::stop_token begin_scan();

  /// Cancel in-flight region work of the current scan.
  void request_rescan();

  [[nodiscard]] bool rescan_requested() const;

  /// Remember the latest result (used to resolve corrections).
  void record(const MultiDrugResult& result);

  [[nodiscard]] std::optional<MultiDrugResult> last_result() const;
  [[nodiscard]] std::size_t scan_count() const;

 private:
  std::string id_;
  ImageSource source_;
  mutable std::mutex mutex_;
  std::stop_source stop_;
  std::optional<MultiDrugResult> last_;
  std::size_t scans_{0};
};

}  // namespace boxscan::core
