#include <invoscan/app/json_codec.hpp>
#include <invoscan/core/error.hpp>
#include <invoscan/core/field.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <string>

namespace na = invoscan::app;
namespace nc = invoscan::core;

TEST(JsonCodec, WordsFromOcrPage) {
  const auto j = na::Json::parse(R"([
    {"text": "Invoice", "left": 10, "top": 20, "width": 60, "height": 12, "conf": 96.5},
    {"text": "No", "conf": 91}
  ])");
  const auto words = na::words_from_json(j);
  ASSERT_TRUE(words.has_value());
  ASSERT_EQ(words->size(), 2u);
  EXPECT_EQ((*words)[0].text, "Invoice");
  EXPECT_EQ((*words)[0].left, 10);
  EXPECT_EQ((*words)[0].height, 12);
  EXPECT_DOUBLE_EQ((*words)[0].confidence, 96.5);
  EXPECT_EQ((*words)[1].width, 0);
  EXPECT_DOUBLE_EQ((*words)[1].confidence, 91.0);
}

TEST(JsonCodec, WordBoxOutOfIntRangeIsClamped) {
  auto j = na::Json::parse(R"([
    {"text": "a", "left": 1e300, "top": -1e12, "width": 12.9, "height": 4294967296}
  ])");
  j[0]["conf"] = 88.0;
  na::Json nan_box = na::Json::array();
  nan_box.push_back(na::Json{{"text", "b"},
                             {"left", std::numeric_limits<double>::quiet_NaN()},
                             {"top", std::numeric_limits<double>::infinity()}});

  const auto words = na::words_from_json(j);
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ((*words)[0].left, std::numeric_limits<int>::max());
  EXPECT_EQ((*words)[0].top, std::numeric_limits<int>::min());
  EXPECT_EQ((*words)[0].width, 12);
  EXPECT_EQ((*words)[0].height, std::numeric_limits<int>::max());

  const auto odd = na::words_from_json(nan_box);
  ASSERT_TRUE(odd.has_value());
  EXPECT_EQ((*odd)[0].left, 0);
  EXPECT_EQ((*odd)[0].top, 0);
}

TEST(JsonCodec, WordsRejectMalformedPage) {
  EXPECT_EQ(na::words_from_json(na::Json::object()).error(), nc::ExtractionError::MalformedInput);
  EXPECT_EQ(na::words_from_json(na::Json::parse(R"([{"left": 1}])")).error(),
            nc::ExtractionError::MalformedInput);
  EXPECT_EQ(na::words_from_json(na::Json::parse(R"([{"text": 5}])")).error(),
            nc::ExtractionError::MalformedInput);
}

TEST(JsonCodec, FieldSetLayout) {
  nc::FieldSet fields;
  fields["invoice_number"] = nc::FieldValue::present_value("INV-1", 0.95);
  fields["date"] = nc::FieldValue::absent();
  const auto j = na::field_set_to_json(fields);
  EXPECT_EQ(j["invoice_number"]["value"], "INV-1");
  EXPECT_DOUBLE_EQ(j["invoice_number"]["confidence"].get<double>(), 0.95);
  EXPECT_EQ(j["invoice_number"]["present"], true);
  EXPECT_TRUE(j["date"]["value"].is_null());
  EXPECT_EQ(j["date"]["present"], false);
  EXPECT_DOUBLE_EQ(j["date"]["confidence"].get<double>(), 0.0);
}

TEST(JsonCodec, FieldSetNumericValueReadAsText) {
  const auto j = na::Json::parse(R"({
    "total": {"value": 354, "confidence": 0.9, "present": true},
    "discount": {"value": "12.50", "confidence": 0.9},
    "gst_amount": {"value": null, "confidence": 0.4, "present": true}
  })");
  const auto fields = na::field_set_from_json(j);
  ASSERT_TRUE(fields.has_value());
  EXPECT_EQ(*fields->at("total").value, "354");
  EXPECT_TRUE(fields->at("total").present);
  EXPECT_EQ(*fields->at("discount").value, "12.50");
  EXPECT_TRUE(fields->at("discount").present);
  // present follows the value
  EXPECT_FALSE(fields->at("gst_amount").present);
  EXPECT_DOUBLE_EQ(fields->at("gst_amount").confidence, 0.0);
}

TEST(JsonCodec, FieldSetRejectsNonObject) {
  EXPECT_FALSE(na::field_set_from_json(na::Json::array()).has_value());
  EXPECT_FALSE(na::field_set_from_json(na::Json::parse(R"({"total": 5})")).has_value());
}

TEST(JsonCodec, LineItemsReadBack) {
  const std::vector<nc::LineItem> items = {{"Widget Blue", 2, 100, 200, true},
                                           {"Pen Red", 3, 10, 35, false}};
  const auto back = na::line_items_from_json(na::line_items_to_json(items));
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, items);
}

TEST(JsonCodec, LineItemMissingNumberRejected) {
  const auto j = na::Json::parse(R"([{"description": "x", "qty": 1, "unit_price": 2}])");
  EXPECT_EQ(na::line_items_from_json(j).error(), nc::ExtractionError::MalformedInput);
}

TEST(JsonCodec, FailureReportLayout) {
  const auto j = na::report_to_json(
      nc::VerificationReport::failure("Value extraction error: field 'total' is absent"));
  EXPECT_EQ(j.size(), 4u);
  EXPECT_EQ(j["verified"], false);
  EXPECT_EQ(j["error"], "Value extraction error: field 'total' is absent");
  EXPECT_DOUBLE_EQ(j["confidence"].get<double>(), 0.0);
  EXPECT_TRUE(j["error_margin"].is_null());
  EXPECT_EQ(j.dump(), R"({"verified":false,"error":"Value extraction error: field 'total' is absent","confidence":0.0,"error_margin":null})");
}

TEST(JsonCodec, SuccessReportReadBack) {
  nc::VerificationReport r;
  r.verified = true;
  r.confidence = 0.997;
  r.error_margin = 0.5;
  r.figures = nc::VerificationFigures{300.0, 300.0, 354.5, 354.0, 54.0, 0.0};
  const auto j = na::report_to_json(r);
  EXPECT_EQ(j.size(), 9u);
  EXPECT_FALSE(j.contains("error"));
  const auto back = na::report_from_json(j);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, r);

  const auto failure = na::report_from_json(na::report_to_json(nc::VerificationReport::failure("x")));
  ASSERT_TRUE(failure.has_value());
  EXPECT_TRUE(failure->failed());
  EXPECT_EQ(*failure->error, "x");
}
