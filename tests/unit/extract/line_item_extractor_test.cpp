#include <invoscan/core/line_item.hpp>
#include <invoscan/core/word_record.hpp>
#include <invoscan/extract/line_item_extractor.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ne = invoscan::extract;
namespace nc = invoscan::core;

namespace {

std::vector<nc::WordRecord> words(const std::vector<std::string>& texts) {
  std::vector<nc::WordRecord> out;
  for (const auto& t : texts) out.push_back({t, 0, 0, 10, 10, 90.0});
  return out;
}

}  // namespace

TEST(LineItemExtractor, EmptyInput) {
  ne::LineItemExtractor ex;
  EXPECT_TRUE(ex.extract({}).empty());
}

TEST(LineItemExtractor, ValidRow) {
  ne::LineItemExtractor ex;
  const auto items = ex.extract(words({"1", "Widget", "Blue", "2", "100", "200"}));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].description, "Widget Blue");
  EXPECT_DOUBLE_EQ(items[0].qty, 2.0);
  EXPECT_DOUBLE_EQ(items[0].unit_price, 100.0);
  EXPECT_DOUBLE_EQ(items[0].row_total, 200.0);
  EXPECT_TRUE(items[0].valid);
}

TEST(LineItemExtractor, RowOutsideToleranceIsInvalid) {
  ne::LineItemExtractor ex;
  const auto items = ex.extract(words({"1", "Widget", "Blue", "2", "100", "205"}));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_FALSE(items[0].valid);
}

TEST(LineItemExtractor, ToleranceIsConfigurable) {
  ne::LineItemConfig cfg;
  cfg.row_tolerance = 10.0;
  ne::LineItemExtractor ex(cfg);
  const auto items = ex.extract(words({"1", "Widget", "Blue", "2", "100", "205"}));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_TRUE(items[0].valid);
}

TEST(LineItemExtractor, TooFewNumericTokensDiscarded) {
  ne::LineItemExtractor ex;
  EXPECT_TRUE(ex.extract(words({"1", "Desc", "x", "y", "2"})).empty());
}

TEST(LineItemExtractor, ThreeNumericTokensHaveNoRowTotal) {
  ne::LineItemExtractor ex;
  EXPECT_TRUE(ex.extract(words({"1", "A", "B", "2", "100"})).empty());
}

TEST(LineItemExtractor, ThousandsSeparatorsStripped) {
  ne::LineItemExtractor ex;
  const auto items = ex.extract(words({"1", "Steel", "Rod", "1,000", "2", "2,000"}));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_DOUBLE_EQ(items[0].qty, 1000.0);
  EXPECT_DOUBLE_EQ(items[0].unit_price, 2.0);
  EXPECT_DOUBLE_EQ(items[0].row_total, 2000.0);
  EXPECT_TRUE(items[0].valid);
}

TEST(LineItemExtractor, UnparsableCandidateSkippedAndScanContinues) {
  ne::LineItemExtractor ex;
  const auto items = ex.extract(words({"1", "A", "B", "2pcs", "100", "200",
                                       "a", "b", "c", "d", "e", "f", "g",
                                       "5", "Pen", "Red", "3", "10", "30"}));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].description, "Pen Red");
  EXPECT_DOUBLE_EQ(items[0].qty, 3.0);
  EXPECT_DOUBLE_EQ(items[0].unit_price, 10.0);
  EXPECT_DOUBLE_EQ(items[0].row_total, 30.0);
}

TEST(LineItemExtractor, RejectedWindowDoesNotSkipItsTokens) {
  ne::LineItemExtractor ex;
  // "1" sees only two numeric tokens in its window; "2" inside that window still starts a row.
  const auto items = ex.extract(words({"1", "A", "B", "C", "D", "E", "F", "2",
                                       "Pen", "Ink", "4", "5", "20"}));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].description, "Pen Ink");
  EXPECT_DOUBLE_EQ(items[0].qty, 4.0);
  EXPECT_TRUE(items[0].valid);
}

TEST(LineItemExtractor, AcceptedRowsMayOverlap) {
  ne::LineItemExtractor ex;
  const auto items = ex.extract(words({"1", "Widget", "Blue", "2", "100", "200", "300", "400"}));
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].description, "Widget Blue");
  EXPECT_TRUE(items[0].valid);
  EXPECT_EQ(items[1].description, "100 200");
  EXPECT_DOUBLE_EQ(items[1].qty, 100.0);
  EXPECT_DOUBLE_EQ(items[1].row_total, 300.0);
  EXPECT_FALSE(items[1].valid);
  EXPECT_DOUBLE_EQ(items[2].qty, 200.0);
  EXPECT_DOUBLE_EQ(items[2].unit_price, 300.0);
  EXPECT_DOUBLE_EQ(items[2].row_total, 400.0);
}

TEST(LineItemExtractor, WindowIsBounded) {
  ne::LineItemExtractor ex;
  // Row total lies at offset 8, outside the eight-word window.
  EXPECT_TRUE(ex.extract(words({"1", "a", "b", "c", "d", "e", "2", "3", "6"})).empty());
}

TEST(LineItemExtractor, TryRowAtRejectsNonDigitStart) {
  ne::LineItemExtractor ex;
  const auto w = words({"No.", "2", "100", "200", "300"});
  EXPECT_FALSE(ex.try_row_at(w, 0).has_value());
  EXPECT_FALSE(ex.try_row_at(w, 99).has_value());
  EXPECT_TRUE(ex.try_row_at(w, 1).has_value());
}
