#ifdef BOXSCAN_HAS_TBB

#include <boxscan/app/scanner.hpp>
#include <boxscan/app/scanner_tbb.hpp>
#include <boxscan/match/in_memory_catalog.hpp>
#include <boxscan/vision/mock_region_proposer.hpp>
#include <boxscan/vision/mock_text_recognizer.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace na = boxscan::app;
namespace nc = boxscan::core;
namespace nm = boxscan::match;
namespace nv = boxscan::vision;

na::Scanner make_scanner() {
  auto catalog = std::make_shared<nm::InMemoryCatalog>();
  catalog->add(nc::CatalogEntry{0, "Paracetamol", "paracetamol", {"Parol"}, "analgesic", "",
                                {}, 120});
  auto proposer = std::make_shared<nv::MockRegionProposer>();
  proposer->set_proposals({{{170, 90, 300, 300}, 0.92f}});
  auto recognizer = std::make_shared<nv::MockTextRecognizer>();
  recognizer->set_default_text("PAROL 500 mg 20 tablet");

  na::ScannerComponents components;
  components.detector = std::make_shared<nv::RegionDetector>(proposer);
  components.extractor = std::make_shared<nv::TextExtractor>(recognizer);
  components.features = std::make_shared<nv::FeatureExtractor>();
  components.catalog = catalog;
  components.worker_count = 1;
  return na::Scanner(std::move(components));
}

nc::Image make_photo(std::uint32_t w = 640, std::uint32_t h = 480) {
  std::vector<std::byte> buffer(nc::Image::min_bytes(w, h, nc::PixelFormat::BGR8),
                                std::byte{200});
  return nc::Image(w, h, nc::PixelFormat::BGR8, std::move(buffer));
}

}  // namespace

TEST(ScannerTbbTest, CallbackPerWorkItem) {
  const na::Scanner scanner = make_scanner();
  std::vector<std::pair<std::string, nc::Image>> work_items;
  work_items.emplace_back("counter_1", make_photo());
  work_items.emplace_back("counter_2", make_photo());
  work_items.emplace_back("counter_3", make_photo());

  std::atomic<std::size_t> call_count{0};
  std::vector<std::string> session_ids;
  std::mutex mutex;
  na::process_batch_tbb(
      scanner, work_items,
      [&](const std::string& session_id,
          const std::expected<nc::MultiDrugResult, nc::ScanError>& result) {
        call_count++;
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->session_id, session_id);
        EXPECT_EQ(result->source, nc::ImageSource::File);
        EXPECT_EQ(result->drug_names, std::vector<std::string>{"Paracetamol"});
        std::lock_guard lock(mutex);
        session_ids.push_back(session_id);
      });
  EXPECT_EQ(call_count.load(), 3u);
  std::sort(session_ids.begin(), session_ids.end());
  EXPECT_EQ(session_ids, (std::vector<std::string>{"counter_1", "counter_2", "counter_3"}));
}

TEST(ScannerTbbTest, DetectionFailureReachesCallback) {
  const na::Scanner scanner = make_scanner();
  std::vector<std::pair<std::string, nc::Image>> work_items;
  work_items.emplace_back("broken", nc::Image{});
  std::atomic<std::size_t> failures{0};
  na::process_batch_tbb(
      scanner, work_items,
      [&](const std::string&, const std::expected<nc::MultiDrugResult, nc::ScanError>& result) {
        if (!result && result.error() == nc::ScanError::DetectionFailure) failures++;
      },
      nc::ImageSource::Gallery);
  EXPECT_EQ(failures.load(), 1u);
}

TEST(ScannerTbbTest, EmptyWorkItemsDoesNotCallCallback) {
  const na::Scanner scanner = make_scanner();
  std::vector<std::pair<std::string, nc::Image>> work_items;
  std::atomic<std::size_t> call_count{0};
  na::process_batch_tbb(scanner, work_items,
                        [&](const std::string&,
                            const std::expected<nc::MultiDrugResult, nc::ScanError>&) {
                          call_count++;
                        });
  EXPECT_EQ(call_count.load(), 0u);
}

#endif  // BOXSCAN_HAS_TBB
