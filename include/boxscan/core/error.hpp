#pragma once

#include <string_view>

namespace boxscan::core {

/// Scan error codes; used with std::expected for recoverable failures.
/// Per-region codes end up in RegionResult::errors; only DetectionFailure
/// aborts a whole image.
enum class ScanError {
  None = 0,
  DetectionFailure,
  ExtractionFailure,
  RecoveryFailure,
  NoMatchFound,
  IndexUnavailable,
  Timeout,
  ServiceUnavailable,
  InvalidInput,
  InvalidImage,
  LoadFailed,
  InvalidConfig,
  Cancelled,
};

[[nodiscard]] std::string_view to_string(ScanError error) noexcept;

}  // namespace boxscan::core
