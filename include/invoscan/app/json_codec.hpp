#pragma once

#include <invoscan/core/error.hpp>
#include <invoscan/core/field.hpp>
#include <invoscan/core/line_item.hpp>
#include <invoscan/core/verification_report.hpp>
#include <invoscan/core/word_record.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <vector>

namespace invoscan::app {

/// Insertion-ordered JSON so artifacts list keys in a stable, readable order.
using Json = nlohmann::ordered_json;

/// OCR page: [{text, left, top, width, height, conf}, ...].
[[nodiscard]] Json words_to_json(const std::vector<invoscan::core::WordRecord>& words);
[[nodiscard]] std::expected<std::vector<invoscan::core::WordRecord>, invoscan::core::ExtractionError>
words_from_json(const Json& j);

/// {name: {value, confidence, present}, ...}. A numeric value is read back as its text.
[[nodiscard]] Json field_set_to_json(const invoscan::core::FieldSet& fields);
[[nodiscard]] std::expected<invoscan::core::FieldSet, invoscan::core::ExtractionError>
field_set_from_json(const Json& j);

/// [{description, qty, unit_price, row_total, valid}, ...].
[[nodiscard]] Json line_items_to_json(const std::vector<invoscan::core::LineItem>& items);
[[nodiscard]] std::expected<std::vector<invoscan::core::LineItem>, invoscan::core::ExtractionError>
line_items_from_json(const Json& j);

/// Success: {verified, confidence, error_margin, extracted_subtotal, computed_subtotal,
/// extracted_total, computed_total, gst, discount}.
/// Failure: {verified: false, error, confidence: 0.0, error_margin: null}.
[[nodiscard]] Json report_to_json(const invoscan::core::VerificationReport& report);
[[nodiscard]] std::expected<invoscan::core::VerificationReport, invoscan::core::ExtractionError>
report_from_json(const Json& j);

}  // namespace invoscan::app
