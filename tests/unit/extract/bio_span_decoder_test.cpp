#include <invoscan/extract/bio_span_decoder.hpp>
#include <invoscan/extract/entity_tagger.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ne = invoscan::extract;

TEST(BioSpanDecoder, EmptyInput) {
  ne::BioSpanDecoder dec;
  EXPECT_TRUE(dec.decode({}, {}).empty());
}

TEST(BioSpanDecoder, MergesInsideTokens) {
  ne::BioSpanDecoder dec;
  const std::vector<std::string> tokens = {"Acme", "Corp", "ships", "to", "New", "Delhi"};
  const std::vector<std::string> labels = {"B-ORG", "I-ORG", "O", "O", "B-GPE", "I-GPE"};
  const auto spans = dec.decode(tokens, labels);
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0], (ne::TaggedSpan{"Acme Corp", ne::EntityCategory::Organization}));
  EXPECT_EQ(spans[1], (ne::TaggedSpan{"New Delhi", ne::EntityCategory::Location}));
}

TEST(BioSpanDecoder, BeginStartsNewSpanOfSameType) {
  ne::BioSpanDecoder dec;
  const auto spans = dec.decode({"Acme", "Globex"}, {"B-ORG", "B-ORG"});
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0].text, "Acme");
  EXPECT_EQ(spans[1].text, "Globex");
}

TEST(BioSpanDecoder, InsideAfterOutsideOrOtherTypeStartsSpan) {
  ne::BioSpanDecoder dec;
  const auto spans = dec.decode({"the", "Pune", "Ravi", "Kumar"},
                                {"O", "I-LOC", "I-PER", "I-PER"});
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0], (ne::TaggedSpan{"Pune", ne::EntityCategory::Location}));
  EXPECT_EQ(spans[1], (ne::TaggedSpan{"Ravi Kumar", ne::EntityCategory::Organization}));
}

TEST(BioSpanDecoder, UnmappedTypesDropped) {
  ne::BioSpanDecoder dec;
  const auto spans = dec.decode({"12", "March", "Mumbai"}, {"B-DATE", "I-DATE", "B-LOC"});
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].text, "Mumbai");
}

TEST(BioSpanDecoder, MismatchedLengthsUseShorter) {
  ne::BioSpanDecoder dec;
  const auto spans = dec.decode({"Acme", "Corp", "Ltd"}, {"B-ORG", "I-ORG"});
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].text, "Acme Corp");
}

TEST(CategoryForEntityType, Mapping) {
  EXPECT_EQ(ne::category_for_entity_type("ORG"), ne::EntityCategory::Organization);
  EXPECT_EQ(ne::category_for_entity_type("PERSON"), ne::EntityCategory::Organization);
  EXPECT_EQ(ne::category_for_entity_type("per"), ne::EntityCategory::Organization);
  EXPECT_EQ(ne::category_for_entity_type("gpe"), ne::EntityCategory::Location);
  EXPECT_EQ(ne::category_for_entity_type("LOC"), ne::EntityCategory::Location);
  EXPECT_FALSE(ne::category_for_entity_type("MONEY").has_value());
}
