#include <boxscan/vision/text_extractor.hpp>
#include <boxscan/core/log.hpp>
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace boxscan::vision {

namespace nc = boxscan::core;

namespace {

bool is_alnum_byte(unsigned char c) {
  // Bytes >= 0x80 are UTF-8 sequences; on a box label these are letters.
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80;
}

bool is_letter_byte(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80;
}

bool is_space_byte(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_word_like(std::string_view token) {
  if (token.size() < 2) return false;
  std::size_t alnum = 0;
  bool has_letter = false;
  for (char ch : token) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_alnum_byte(c)) ++alnum;
    if (is_letter_byte(c)) has_letter = true;
  }
  return has_letter && alnum * 5 >= token.size() * 4;
}

/// Sleep for \p delay unless \p stop fires first. Returns false on stop.
bool interruptible_wait(std::chrono::milliseconds delay, std::stop_token stop) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock lock(m);
  static_cast<void>(cv.wait_for(lock, stop, delay, [] { return false; }));
  return !stop.stop_requested();
}

}  // namespace

TextExtractor::TextExtractor(std::shared_ptr<ITextRecognizer> recognizer,
                             TextExtractorConfig config)
    : recognizer_(std::move(recognizer)), config_(config) {
  if (!recognizer_) {
    throw std::invalid_argument("TextExtractor: recognizer must not be null");
  }
}

float TextExtractor::quality_score(std::string_view text) {
  std::size_t alnum = 0;
  std::size_t non_space = 0;
  std::size_t tokens = 0;
  std::size_t word_like = 0;

  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && is_space_byte(static_cast<unsigned char>(text[i]))) ++i;
    const std::size_t start = i;
    while (i < text.size() && !is_space_byte(static_cast<unsigned char>(text[i]))) {
      const auto c = static_cast<unsigned char>(text[i]);
      ++non_space;
      if (is_alnum_byte(c)) ++alnum;
      ++i;
    }
    if (i > start) {
      ++tokens;
      if (is_word_like(text.substr(start, i - start))) ++word_like;
    }
  }
  if (non_space == 0) {
    return 0.f;
  }
  const float density = static_cast<float>(alnum) / static_cast<float>(non_space);
  const float token_ratio = static_cast<float>(word_like) / static_cast<float>(tokens);
  float quality = 0.5f * density + 0.5f * token_ratio;
  if (alnum < 3) {
    quality *= 0.5f;
  }
  return std::clamp(quality, 0.f, 1.f);
}

std::expected<nc::ExtractedText, nc::ScanError> TextExtractor::extract(
    const nc::Region& region, std::stop_token stop) const {
  const auto started = std::chrono::steady_clock::now();
  std::chrono::milliseconds backoff = config_.backoff_initial;
  const int max_attempts = 1 + std::max(0, config_.max_retries);

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (stop.stop_requested()) {
      return std::unexpected(nc::ScanError::Cancelled);
    }
    const auto call_started = std::chrono::steady_clock::now();
    auto reply = recognizer_->recognize(region, RecognitionOptions{config_.timeout, stop});
    const auto call_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - call_started);

    if (reply && call_time > config_.timeout) {
      reply = std::unexpected(nc::ScanError::Timeout);
    }
    if (reply) {
      nc::ExtractedText out;
      out.region_id = region.id;
      out.raw_text = std::move(reply->text);
      out.quality = quality_score(out.raw_text);
      out.service_confidence = reply->confidence;
      out.attempts = static_cast<std::uint32_t>(attempt);
      out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      return out;
    }

    const nc::ScanError error = reply.error();
    if (error == nc::ScanError::Cancelled || stop.stop_requested()) {
      return std::unexpected(nc::ScanError::Cancelled);
    }
    if (error != nc::ScanError::ServiceUnavailable) {
      core::log_warn("extract") << "region " << region.id << ": " << nc::to_string(error);
      return std::unexpected(nc::ScanError::ExtractionFailure);
    }
    if (attempt == max_attempts) {
      break;
    }
    core::log_debug("extract") << "region " << region.id << ": service unavailable, retry " << attempt
                               << " in " << backoff.count() << " ms";
    if (!interruptible_wait(backoff, stop)) {
      return std::unexpected(nc::ScanError::Cancelled);
    }
    backoff = std::min(backoff * 2, config_.backoff_max);
  }

  core::log_warn("extract") << "region " << region.id << ": service unavailable after "
                            << max_attempts << " attempts";
  return std::unexpected(nc::ScanError::ExtractionFailure);
}

}  // namespace boxscan::vision
