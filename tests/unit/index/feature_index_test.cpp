#include <boxscan/index/feature_index.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace nc = boxscan::core;
namespace ni = boxscan::index;

namespace {

std::vector<nc::FeatureVector> features(std::vector<float> color, std::vector<float> edge) {
  std::vector<nc::FeatureVector> out(2);
  out[0].type = nc::FeatureType::ColorHistogram;
  out[0].values = std::move(color);
  out[0].confidence = 0.9f;
  out[1].type = nc::FeatureType::Edge;
  out[1].values = std::move(edge);
  out[1].confidence = 0.5f;
  return out;
}

ni::StoredImage stored(std::string ref, std::string drug, std::vector<float> color) {
  return ni::StoredImage{std::move(ref), std::move(drug), features(std::move(color), {1.f, 0.f})};
}

std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

TEST(FeatureIndex, NearestAppliesFloorAndOrder) {
  ni::FeatureIndex index;
  index.add(stored("catalog/parol-b.png", "Paracetamol", {1.f, 0.f, 0.f, 0.f}));
  index.add(stored("catalog/advil.png", "Ibuprofen", {0.5f, 0.5f, 0.f, 0.f}));
  index.add(stored("catalog/parol-a.png", "Paracetamol", {1.f, 0.f, 0.f, 0.f}));

  const auto query = features({1.f, 0.f, 0.f, 0.f}, {1.f, 0.f});
  auto matches = index.nearest(query, 10);
  ASSERT_TRUE(matches.has_value());
  // advil: (0.3 * 0.5 + 0.2 * 1) / 0.5 = 0.7, below the floor.
  ASSERT_EQ(matches->size(), 2u);
  EXPECT_EQ((*matches)[0].image_ref, "catalog/parol-a.png");
  EXPECT_EQ((*matches)[1].image_ref, "catalog/parol-b.png");
  EXPECT_FLOAT_EQ((*matches)[0].similarity, 1.f);
  EXPECT_EQ((*matches)[0].agreeing_types.size(), 2u);

  auto top = index.nearest(query, 1);
  ASSERT_TRUE(top.has_value());
  EXPECT_EQ(top->size(), 1u);
}

TEST(FeatureIndex, NearestWithNothingToCompare) {
  ni::FeatureIndex index;
  index.add(stored("catalog/parol.png", "Paracetamol", {1.f, 0.f}));
  auto none = index.nearest({}, 5);
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->empty());
  auto zero_k = index.nearest(features({1.f, 0.f}, {1.f, 0.f}), 0);
  ASSERT_TRUE(zero_k.has_value());
  EXPECT_TRUE(zero_k->empty());
}

TEST(FeatureIndex, StagedImagesAppearAfterOptimize) {
  ni::FeatureIndex index;
  index.stage(stored("catalog/parol.png", "Paracetamol", {1.f, 0.f}));
  EXPECT_EQ(index.size(), 0u);
  EXPECT_EQ(index.pending_count(), 1u);
  const auto query = features({1.f, 0.f}, {1.f, 0.f});
  EXPECT_TRUE(index.nearest(query, 5)->empty());

  auto report = index.optimize();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->vectors_updated, 2u);
  EXPECT_EQ(report->duplicates_removed, 0u);
  EXPECT_EQ(index.size(), 1u);
  EXPECT_EQ(index.pending_count(), 0u);
  EXPECT_EQ(index.nearest(query, 5)->size(), 1u);
}

TEST(FeatureIndex, OptimizeReplacesSameReference) {
  ni::FeatureIndex index;
  index.add(stored("catalog/box.png", "Paracetamol", {1.f, 0.f}));
  index.stage(stored("catalog/box.png", "Ibuprofen", {0.f, 1.f}));
  ASSERT_TRUE(index.optimize().has_value());
  EXPECT_EQ(index.size(), 1u);
  auto matches = index.nearest(features({0.f, 1.f}, {1.f, 0.f}), 5);
  ASSERT_EQ(matches->size(), 1u);
  EXPECT_EQ((*matches)[0].drug_name, "Ibuprofen");
}

TEST(FeatureIndex, OptimizeRemovesNearDuplicatesOfSameDrug) {
  ni::FeatureIndex index;
  index.add(stored("catalog/parol-1.png", "Paracetamol", {1.f, 0.f}));
  index.add(stored("catalog/parol-2.png", "PARACETAMOL", {1.f, 0.f}));
  index.add(stored("catalog/lookalike.png", "Ibuprofen", {1.f, 0.f}));
  auto report = index.optimize();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->duplicates_removed, 1u);
  EXPECT_EQ(index.size(), 2u);
  auto matches = index.nearest(features({1.f, 0.f}, {1.f, 0.f}), 5);
  ASSERT_EQ(matches->size(), 2u);
  EXPECT_EQ((*matches)[1].image_ref, "catalog/parol-1.png");
}

TEST(FeatureIndex, AbsorbStagesCorrections) {
  ni::FeatureIndex index;
  nc::CorrectionRecord record;
  record.session_id = "s1";
  record.region_id = 2;
  record.corrected_name = "Paracetamol";
  record.features = features({1.f, 0.f}, {1.f, 0.f});
  index.absorb(record);

  nc::CorrectionRecord rejected = record;
  rejected.kind = nc::Rejected{};
  index.absorb(rejected);

  nc::CorrectionRecord featureless = record;
  featureless.features.clear();
  index.absorb(featureless);

  EXPECT_EQ(index.pending_count(), 1u);
  ASSERT_TRUE(index.optimize().has_value());
  auto matches = index.nearest(record.features, 5);
  ASSERT_EQ(matches->size(), 1u);
  EXPECT_EQ((*matches)[0].image_ref, "correction/s1/2");
  EXPECT_EQ((*matches)[0].drug_name, "Paracetamol");
}

TEST(FeatureIndex, SaveAndLoad) {
  const std::string path = temp_path("boxscan_feature_index_test.txt");
  ni::FeatureIndex index;
  index.add(stored("catalog/parol.png", "Paracetamol", {0.25f, 0.75f}));
  index.add(stored("catalog/advil.png", "Ibuprofen", {0.75f, 0.25f}));
  ASSERT_TRUE(index.save(path).has_value());

  ni::FeatureIndex loaded;
  auto count = loaded.load_file(path);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 2u);
  EXPECT_EQ(loaded.size(), 2u);
  auto matches = loaded.nearest(features({0.25f, 0.75f}, {1.f, 0.f}), 1);
  ASSERT_EQ(matches->size(), 1u);
  EXPECT_EQ((*matches)[0].drug_name, "Paracetamol");
  std::filesystem::remove(path);
}

TEST(FeatureIndex, LoadSkipsMalformedLines) {
  const std::string path = temp_path("boxscan_feature_index_malformed.txt");
  std::ofstream(path) << "# ref|drug|type|confidence|values\n"
                      << "catalog/parol.png|Paracetamol|color|0.9|1,0\n"
                      << "catalog/parol.png|Paracetamol|edge|0.5|1,0\n"
                      << "catalog/bad.png|Bad|texture|0.5|1,0\n"
                      << "catalog/bad.png|Bad|color|high|1,0\n"
                      << "catalog/bad.png|Bad|color|0.5|1,x\n";
  ni::FeatureIndex index;
  auto count = index.load_file(path);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 1u);
  EXPECT_EQ(index.size(), 1u);
  std::filesystem::remove(path);
}

TEST(FeatureIndex, LoadMissingFileFails) {
  ni::FeatureIndex index;
  auto count = index.load_file("/nonexistent/boxscan/visual_catalog.txt");
  ASSERT_FALSE(count.has_value());
  EXPECT_EQ(count.error(), nc::ScanError::LoadFailed);
}
