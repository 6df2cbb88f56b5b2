#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/region.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace boxscan::vision {

/// Per-call limits handed to a recognizer. Implementations should give up
/// with ScanError::Timeout once \c timeout has elapsed and with
/// ScanError::Cancelled as soon as \c stop is requested.
struct RecognitionOptions {
  std::chrono::milliseconds timeout{5000};
  std::stop_token stop;
};

struct RecognizedText {
  std::string text;
  std::optional<float> confidence;  // [0, 1] when the engine reports one
};

/// Text recognition service: Region -> RecognizedText.
/// recognize() is called concurrently for different regions and must be
/// thread-safe. Transient unavailability is reported as ServiceUnavailable;
/// TextExtractor retries only that code.
class ITextRecognizer {
 public:
  virtual ~ITextRecognizer() = default;

  [[nodiscard]] virtual std::expected<RecognizedText, boxscan::core::ScanError> recognize(
      const boxscan::core::Region& region, const RecognitionOptions& options) = 0;

  /// Optional: load models ahead of the first call. Default: no-op.
  virtual void warmup() {}
};

}  // namespace boxscan::vision
