#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/region.hpp>
#include <boxscan/core/text.hpp>
#include <boxscan/vision/text_recognizer.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <string_view>

namespace boxscan::vision {

struct TextExtractorConfig {
  std::chrono::milliseconds timeout{5000};  // per recognizer call
  int max_retries{3};                        // ServiceUnavailable only
  std::chrono::milliseconds backoff_initial{100};
  std::chrono::milliseconds backoff_max{2000};
};

/// Runs the text recognizer for one region with bounded retry and computes a
/// local quality score for the result.
///
/// Errors: ExtractionFailure for anything the recognizer could not deliver
/// (including Timeout and exhausted retries), Cancelled when \p stop fires.
class TextExtractor {
 public:
  TextExtractor(std::shared_ptr<ITextRecognizer> recognizer, TextExtractorConfig config = {});

  [[nodiscard]] std::expected<boxscan::core::ExtractedText, boxscan::core::ScanError> extract(
      const boxscan::core::Region& region, std::stop_token stop = {}) const;

  /// 0.5 * alphanumeric density + 0.5 * share of word-like tokens, halved
  /// when the text holds fewer than three alphanumerics. Empty text is 0.
  [[nodiscard]] static float quality_score(std::string_view text);

  [[nodiscard]] const TextExtractorConfig& config() const noexcept { return config_; }

 private:
  std::shared_ptr<ITextRecognizer> recognizer_;
  TextExtractorConfig config_;
};

}  // namespace boxscan::vision
