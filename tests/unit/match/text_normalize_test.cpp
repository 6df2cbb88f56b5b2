#include <boxscan/match/text_normalize.hpp>
#include <gtest/gtest.h>

namespace nm = boxscan::match;

TEST(TextNormalize, LowercasesAndCollapsesPunctuation) {
  EXPECT_EQ(nm::normalize_text("  PAROL-500,  Tablet!! "), "parol 500 tablet");
  EXPECT_EQ(nm::normalize_text(""), "");
  EXPECT_EQ(nm::normalize_text("***"), "");
}

TEST(TextNormalize, FoldsTurkishLetters) {
  EXPECT_EQ(nm::normalize_text("A\xC4\x9Fr\xC4\xB1 Kesici \xC5\x9Eurup"), "agri kesici surup");
  EXPECT_EQ(nm::normalize_text("\xC4\xB0\xC3\x87\xC3\x96\xC3\x9C"), "icou");
}

TEST(TextNormalize, Tokenize) {
  const auto tokens = nm::tokenize("parol 500 mg");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], "parol");
  EXPECT_EQ(nm::join_tokens(tokens, 1, 5), "500 mg");
  EXPECT_TRUE(nm::tokenize("").empty());
}

TEST(TextNormalize, DosageTokens) {
  EXPECT_TRUE(nm::is_dosage_token("500"));
  EXPECT_TRUE(nm::is_dosage_token("500mg"));
  EXPECT_TRUE(nm::is_dosage_token("mg"));
  EXPECT_TRUE(nm::is_dosage_token("20x"));
  EXPECT_TRUE(nm::is_dosage_token("tablet"));
  EXPECT_FALSE(nm::is_dosage_token("parol"));
  EXPECT_FALSE(nm::is_dosage_token("b12"));
  EXPECT_EQ(nm::strip_dosage("PAROL 500 mg 20 Tablet"), "parol");
  EXPECT_EQ(nm::strip_dosage("Augmentin BID 1000mg"), "augmentin bid");
}

TEST(TextNormalize, FoldsOcrConfusionsInWordsOnly) {
  EXPECT_EQ(nm::fold_ocr_confusions("par0l 500"), "parol 500");
  EXPECT_EQ(nm::fold_ocr_confusions("5urnax"), "sumax");
  EXPECT_EQ(nm::fold_ocr_confusions("vvater"), "water");
}

TEST(TextNormalize, PhoneticKey) {
  EXPECT_EQ(nm::phonetic_key("parol"), "prl");
  EXPECT_EQ(nm::phonetic_key("paracetamol"), "prktml");
  EXPECT_EQ(nm::phonetic_key("kalpol"), nm::phonetic_key("calpol"));
  EXPECT_EQ(nm::phonetic_key("phenol"), nm::phonetic_key("fenol"));
  EXPECT_EQ(nm::phonetic_key("amoxicillin"), "amxkln");
}
