#include <boxscan/match/in_memory_catalog.hpp>
#include <boxscan/match/recovery_engine.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace nc = boxscan::core;
namespace nm = boxscan::match;

namespace {

std::shared_ptr<nm::InMemoryCatalog> make_catalog() {
  auto catalog = std::make_shared<nm::InMemoryCatalog>();
  catalog->add(nc::CatalogEntry{0, "Paracetamol", "paracetamol", {"Parol", "Calpol"},
                                "analgesic", "", {}, 120});
  catalog->add(nc::CatalogEntry{0, "Amoxicillin", "amoxicillin", {"Augmentin"}, "antibiotic",
                                "", {}, 60});
  catalog->add(nc::CatalogEntry{0, "Metformin", "metformin", {"Glucophage"}, "diabetes", "",
                                {}, 40});
  return catalog;
}

nc::ExtractedText text(std::string raw, float quality, std::size_t region_id = 0) {
  nc::ExtractedText t;
  t.region_id = region_id;
  t.raw_text = std::move(raw);
  t.quality = quality;
  return t;
}

}  // namespace

TEST(RecoveryEngine, DamagedByQualityOrCondition) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  EXPECT_TRUE(engine.is_damaged(text("x", 0.2f), nc::BoxCondition::Perfect));
  EXPECT_FALSE(engine.is_damaged(text("Parol", 0.8f), nc::BoxCondition::Good));
  EXPECT_FALSE(engine.is_damaged(text("Parol", 0.8f), nc::BoxCondition::Worn));
  EXPECT_TRUE(engine.is_damaged(text("Parol", 0.9f), nc::BoxCondition::Damaged));
  EXPECT_TRUE(engine.is_damaged(text("Parol", 0.9f), nc::BoxCondition::SeverelyDamaged));
  // Threshold itself is not damaged.
  EXPECT_FALSE(engine.is_damaged(text("Parol", 0.5f), nc::BoxCondition::Good));
}

TEST(RecoveryEngine, CompletesFoldedOcrConfusion) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  const auto r = engine.recover(text("Paracetam0l", 0.3f, 7), {});
  EXPECT_EQ(r.region_id, 7u);
  EXPECT_EQ(r.text, "Paracetamol");
  EXPECT_EQ(r.method, nc::RecoveryMethod::DictionaryCompletion);
  EXPECT_EQ(r.confidence, 95);
  EXPECT_FALSE(r.low_quality);
}

TEST(RecoveryEngine, BrandKeyRecoversBrandSpelling) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  const auto r = engine.recover(text("Augrnentin", 0.3f), {});
  EXPECT_EQ(r.text, "Augmentin");
  EXPECT_EQ(r.method, nc::RecoveryMethod::DictionaryCompletion);
  EXPECT_EQ(r.confidence, 95);
}

TEST(RecoveryEngine, PartialTextScoresByDistance) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  // Two edits against a nine-letter key.
  const auto r = engine.recover(text("Metfxrmn", 0.3f), {});
  EXPECT_EQ(r.text, "Metformin");
  EXPECT_EQ(r.confidence, 78);
}

TEST(RecoveryEngine, VisualAgreementBoostsAndRetags) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  const std::vector<nc::VisualMatch> visual{{"catalog/parol.png", "paracetamol", 0.9f, {}}};
  const auto r = engine.recover(text("Paracetam0l", 0.3f), visual);
  EXPECT_EQ(r.method, nc::RecoveryMethod::VisualCrossReference);
  EXPECT_EQ(r.confidence, 99);
}

TEST(RecoveryEngine, VisualMatchForAnotherDrugIsIgnored) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  const std::vector<nc::VisualMatch> visual{{"catalog/glifor.png", "Metformin", 0.9f, {}}};
  const auto r = engine.recover(text("Paracetam0l", 0.3f), visual);
  EXPECT_EQ(r.method, nc::RecoveryMethod::DictionaryCompletion);
  EXPECT_EQ(r.confidence, 95);
}

TEST(RecoveryEngine, NothingCloseKeepsOriginal) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  const auto r = engine.recover(text("qzv", 0.1f, 3), {});
  EXPECT_EQ(r.region_id, 3u);
  EXPECT_EQ(r.text, "qzv");
  EXPECT_EQ(r.method, nc::RecoveryMethod::None);
  EXPECT_TRUE(r.low_quality);
  EXPECT_EQ(r.confidence, 0);
  EXPECT_TRUE(r.alternatives.empty());
}

TEST(RecoveryEngine, EmptyTextAndMissingCatalog) {
  nm::RecoveryEngine engine(make_catalog(), nm::RecoveryConfig{});
  EXPECT_EQ(engine.recover(text("", 0.f), {}).method, nc::RecoveryMethod::None);

  nm::RecoveryEngine no_catalog(nullptr, nm::RecoveryConfig{});
  const auto r = no_catalog.recover(text("Paracetam0l", 0.3f), {});
  EXPECT_EQ(r.method, nc::RecoveryMethod::None);
  EXPECT_EQ(r.text, "Paracetam0l");
}
