#include <boxscan/vision/mock_text_recognizer.hpp>
#include <boxscan/vision/text_extractor.hpp>
#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace nc = boxscan::core;
namespace nv = boxscan::vision;
using namespace std::chrono_literals;

namespace {

nc::Region make_region(std::size_t id) {
  nc::Region r;
  r.id = id;
  r.bbox = {0, 0, 4, 4};
  r.image = nc::Image(4, 4, nc::PixelFormat::Grayscale8, std::vector<std::byte>(16));
  return r;
}

nv::TextExtractorConfig fast_config() {
  nv::TextExtractorConfig config;
  config.timeout = 1000ms;
  config.max_retries = 3;
  config.backoff_initial = 1ms;
  config.backoff_max = 4ms;
  return config;
}

}  // namespace

TEST(TextExtractor, QualityScore) {
  EXPECT_FLOAT_EQ(nv::TextExtractor::quality_score(""), 0.f);
  EXPECT_FLOAT_EQ(nv::TextExtractor::quality_score("   "), 0.f);
  EXPECT_NEAR(nv::TextExtractor::quality_score("PAROL 500 mg 20 tablet"), 0.8f, 1e-5f);
  EXPECT_NEAR(nv::TextExtractor::quality_score("~~ qzv ~~"), 0.5f * 3 / 7 + 0.5f / 3, 1e-5f);
  // Fewer than three alphanumerics halves the score.
  EXPECT_NEAR(nv::TextExtractor::quality_score("ab"), 0.5f, 1e-5f);
  EXPECT_FLOAT_EQ(nv::TextExtractor::quality_score("!! ??"), 0.f);
}

TEST(TextExtractor, NullRecognizerThrows) {
  EXPECT_THROW(nv::TextExtractor(nullptr), std::invalid_argument);
}

TEST(TextExtractor, SuccessFillsExtractedText) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_text(2, "PAROL 500 mg 20 tablet", 0.91f);
  nv::TextExtractor extractor(recognizer, fast_config());
  auto text = extractor.extract(make_region(2));
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(text->region_id, 2u);
  EXPECT_EQ(text->raw_text, "PAROL 500 mg 20 tablet");
  EXPECT_NEAR(text->quality, 0.8f, 1e-5f);
  ASSERT_TRUE(text->service_confidence.has_value());
  EXPECT_FLOAT_EQ(*text->service_confidence, 0.91f);
  EXPECT_EQ(text->attempts, 1u);
}

TEST(TextExtractor, RetriesUnavailableService) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_default_text("Parol");
  recognizer->set_failure(0, nc::ScanError::ServiceUnavailable, 2);
  nv::TextExtractor extractor(recognizer, fast_config());
  auto text = extractor.extract(make_region(0));
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(text->attempts, 3u);
  EXPECT_EQ(recognizer->call_count(0), 3);
}

TEST(TextExtractor, GivesUpAfterMaxRetries) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_failure(0, nc::ScanError::ServiceUnavailable);
  auto config = fast_config();
  config.max_retries = 2;
  nv::TextExtractor extractor(recognizer, config);
  auto text = extractor.extract(make_region(0));
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), nc::ScanError::ExtractionFailure);
  EXPECT_EQ(recognizer->call_count(0), 3);
}

TEST(TextExtractor, TimeoutIsNotRetried) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_latency(0, 500ms);
  auto config = fast_config();
  config.timeout = 20ms;
  nv::TextExtractor extractor(recognizer, config);
  const auto started = std::chrono::steady_clock::now();
  auto text = extractor.extract(make_region(0));
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), nc::ScanError::ExtractionFailure);
  EXPECT_EQ(recognizer->call_count(0), 1);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 400ms);
}

TEST(TextExtractor, OtherErrorsFailImmediately) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_failure(0, nc::ScanError::InvalidImage);
  nv::TextExtractor extractor(recognizer, fast_config());
  auto text = extractor.extract(make_region(0));
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), nc::ScanError::ExtractionFailure);
  EXPECT_EQ(recognizer->call_count(0), 1);
}

TEST(TextExtractor, StopBeforeStartIsCancelled) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  nv::TextExtractor extractor(recognizer, fast_config());
  std::stop_source source;
  source.request_stop();
  auto text = extractor.extract(make_region(0), source.get_token());
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), nc::ScanError::Cancelled);
  EXPECT_EQ(recognizer->call_count(0), 0);
}

TEST(TextExtractor, StopInterruptsSlowRecognizer) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_latency(0, 5000ms);
  auto config = fast_config();
  config.timeout = 10000ms;
  nv::TextExtractor extractor(recognizer, config);
  std::stop_source source;
  std::jthread stopper([&source] {
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  });
  const auto started = std::chrono::steady_clock::now();
  auto text = extractor.extract(make_region(0), source.get_token());
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), nc::ScanError::Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);
}

TEST(TextExtractor, ConcurrentSlowRegionsKeepTheirOwnBudget) {
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  for (std::size_t id = 0; id < 3; ++id) {
    recognizer->set_text(id, "Ibuprofen");
    recognizer->set_latency(id, 150ms);
  }
  auto config = fast_config();
  config.timeout = 400ms;
  const nv::TextExtractor extractor(recognizer, config);

  std::array<bool, 3> ok{};
  {
    std::vector<std::jthread> workers;
    for (std::size_t id = 0; id < 3; ++id) {
      workers.emplace_back([&extractor, &ok, id] {
        ok[id] = extractor.extract(make_region(id)).has_value();
      });
    }
  }
  // A recognizer that queued these calls would push the third past 400ms.
  EXPECT_TRUE(ok[0]);
  EXPECT_TRUE(ok[1]);
  EXPECT_TRUE(ok[2]);
  for (std::size_t id = 0; id < 3; ++id) EXPECT_EQ(recognizer->call_count(id), 1);
}
