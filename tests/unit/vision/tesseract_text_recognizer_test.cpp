// Unit tests for TesseractTextRecognizer.
// The bad-language test needs only the library. The rest need trained data:
// set BOXSCAN_TEST_TESSDATA to a tessdata directory holding eng.traineddata.
#include <boxscan/core/error.hpp>
#include <boxscan/core/region.hpp>
#include <boxscan/vision/tesseract_text_recognizer.hpp>
#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace nc = boxscan::core;
namespace nv = boxscan::vision;
using namespace std::chrono_literals;

static std::string get_tessdata_path() {
  const char* env = std::getenv("BOXSCAN_TEST_TESSDATA");
  if (env && env[0] != '\0' && std::filesystem::is_directory(env)) {
    return env;
  }
  return "";
}

static nc::Region make_region(std::size_t id) {
  nc::Region r;
  r.id = id;
  r.bbox = {0, 0, 320, 120};
  r.image = nc::Image(320, 120, nc::PixelFormat::Grayscale8,
                      std::vector<std::byte>(320 * 120, std::byte{255}));
  return r;
}

TEST(TesseractTextRecognizer, ConstructorThrowsForUnknownLanguage) {
  EXPECT_THROW(nv::TesseractTextRecognizer("/nonexistent/tessdata", "zz_no_such_lang"),
               std::runtime_error);
}

TEST(TesseractTextRecognizer, RejectsInvalidImage) {
  const std::string path = get_tessdata_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set BOXSCAN_TEST_TESSDATA to run (tessdata directory)";
  }
  nv::TesseractTextRecognizer recognizer(path, "eng");
  nc::Region empty;
  auto out = recognizer.recognize(empty, nv::RecognitionOptions{5000ms, {}});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), nc::ScanError::InvalidImage);
}

TEST(TesseractTextRecognizer, ConcurrentRegionsUseSeparateEngines) {
  const std::string path = get_tessdata_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set BOXSCAN_TEST_TESSDATA to run (tessdata directory)";
  }
  nv::TesseractTextRecognizer recognizer(path, "eng");
  EXPECT_EQ(recognizer.engine_count(), 1u);

  constexpr std::size_t kRegions = 3;
  std::array<std::expected<nv::RecognizedText, nc::ScanError>, kRegions> replies{
      std::unexpected(nc::ScanError::Cancelled), std::unexpected(nc::ScanError::Cancelled),
      std::unexpected(nc::ScanError::Cancelled)};
  {
    std::vector<std::jthread> workers;
    for (std::size_t i = 0; i < kRegions; ++i) {
      workers.emplace_back([&recognizer, &replies, i] {
        replies[i] = recognizer.recognize(make_region(i), nv::RecognitionOptions{10000ms, {}});
      });
    }
  }
  for (const auto& reply : replies) {
    EXPECT_TRUE(reply.has_value());
  }
  EXPECT_GE(recognizer.engine_count(), 1u);
  EXPECT_LE(recognizer.engine_count(), kRegions);

  // Engines are returned to the pool and reused.
  const std::size_t engines = recognizer.engine_count();
  EXPECT_TRUE(recognizer.recognize(make_region(9), nv::RecognitionOptions{10000ms, {}}).has_value());
  EXPECT_EQ(recognizer.engine_count(), engines);
}
