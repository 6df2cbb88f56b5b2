#include <boxscan/match/in_memory_catalog.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace nc = boxscan::core;
namespace nm = boxscan::match;

namespace {

void fill_catalog(nm::InMemoryCatalog& catalog) {
  catalog.add(nc::CatalogEntry{0, "Paracetamol", "paracetamol", {"Parol", "Calpol", "Parol"},
                               "Analgesic", "N02BE01", {}, 120});
  catalog.add(nc::CatalogEntry{0, "Amoxicillin", "amoxicillin", {"Augmentin"}, "antibiotic",
                               "J01CA04", {}, 60});
  catalog.add(nc::CatalogEntry{0, "Vitamin C 500 mg", "", {}, "", "", {}, 0});
}

std::string write_temp(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream(path) << content;
  return path.string();
}

}  // namespace

TEST(InMemoryCatalog, AddAssignsIdsAndKeys) {
  nm::InMemoryCatalog catalog;
  fill_catalog(catalog);
  EXPECT_EQ(catalog.size(), 3u);

  auto hits = catalog.lookup_by_key("parol");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 1u);
  EXPECT_EQ(hits[0].canonical_name, "Paracetamol");
  EXPECT_EQ(hits[0].brand_aliases.size(), 2u);  // duplicate alias dropped
  EXPECT_EQ(hits[0].category, "analgesic");
  EXPECT_EQ(hits[0].search_keys,
            (std::vector<std::string>{"paracetamol", "parol", "calpol"}));
}

TEST(InMemoryCatalog, DosageIsStrippedFromKeys) {
  nm::InMemoryCatalog catalog;
  fill_catalog(catalog);
  auto hits = catalog.lookup_by_key("vitamin c");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].category, "general");
  EXPECT_TRUE(catalog.lookup_by_key("").empty());
  EXPECT_TRUE(catalog.lookup_by_key("unknown").empty());
}

TEST(InMemoryCatalog, CategoriesAndListing) {
  nm::InMemoryCatalog catalog;
  fill_catalog(catalog);
  EXPECT_EQ(catalog.categories(),
            (std::vector<std::string>{"analgesic", "antibiotic", "general"}));
  EXPECT_EQ(catalog.list_by_category("antibiotic").size(), 1u);
  EXPECT_TRUE(catalog.list_by_category("diabetes").empty());
  EXPECT_EQ(catalog.list_all().size(), 3u);
}

TEST(InMemoryCatalog, LoadFile) {
  const std::string path = write_temp("boxscan_catalog_test.txt",
                                      "# name|generic|brands|category|atc|usage\n"
                                      "Ibuprofen|ibuprofen|Advil, Nurofen|analgesic|M01AE01|80\n"
                                      "\n"
                                      "Metformin||Glucophage|diabetes\n"
                                      "Broken|x|y|z|w|not-a-number\n"
                                      "|missing name\n");
  nm::InMemoryCatalog catalog;
  auto added = catalog.load_file(path);
  ASSERT_TRUE(added.has_value());
  EXPECT_EQ(*added, 3u);

  auto ibu = catalog.lookup_by_key("nurofen");
  ASSERT_EQ(ibu.size(), 1u);
  EXPECT_EQ(ibu[0].usage_count, 80u);
  EXPECT_EQ(ibu[0].atc_code, "M01AE01");

  auto met = catalog.lookup_by_key("metformin");
  ASSERT_EQ(met.size(), 1u);
  EXPECT_EQ(met[0].generic_name, "Metformin");
  EXPECT_EQ(catalog.lookup_by_key("broken")[0].usage_count, 0u);
  std::filesystem::remove(path);
}

TEST(InMemoryCatalog, LoadMissingFileFails) {
  nm::InMemoryCatalog catalog;
  auto added = catalog.load_file("/nonexistent/boxscan/catalog.txt");
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error(), nc::ScanError::LoadFailed);
}

TEST(InMemoryCatalog, AbsorbAddsObservedKey) {
  nm::InMemoryCatalog catalog;
  fill_catalog(catalog);
  nc::CorrectionRecord record;
  record.observed_text = "PAR0L 500mg";
  record.corrected_name = "Parol";
  record.kind = nc::NameEdit{};
  ASSERT_TRUE(catalog.absorb(record).has_value());

  auto hits = catalog.lookup_by_key("par0l");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].canonical_name, "Paracetamol");
  EXPECT_EQ(hits[0].usage_count, 121u);
}

TEST(InMemoryCatalog, AbsorbRejectsUnknownAndEmpty) {
  nm::InMemoryCatalog catalog;
  fill_catalog(catalog);
  nc::CorrectionRecord record;
  record.observed_text = "xyz";
  record.corrected_name = "Unobtainium";
  auto unknown = catalog.absorb(record);
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), nc::ScanError::NoMatchFound);

  record.corrected_name = "";
  auto empty = catalog.absorb(record);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), nc::ScanError::InvalidInput);

  record.kind = nc::Rejected{};
  EXPECT_TRUE(catalog.absorb(record).has_value());
  EXPECT_TRUE(catalog.lookup_by_key("xyz").empty());
}
