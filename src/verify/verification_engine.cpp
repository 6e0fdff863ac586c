#include <invoscan/verify/verification_engine.hpp>
#include <invoscan/extract/numeric.hpp>
#include <algorithm>
#include <cmath>
#include <expected>
#include <string>

namespace invoscan::verify {

namespace {

namespace fn = invoscan::core::field_names;
using invoscan::extract::round_to;

/// Numeric value of a field, or a message naming why it has none.
std::expected<double, std::string> coerce(const invoscan::core::FieldSet& fields,
                                          const char* name) {
  const auto it = fields.find(name);
  if (it == fields.end() || !it->second.present || !it->second.value) {
    return std::unexpected(std::string("field '") + name + "' is absent");
  }
  const auto parsed = invoscan::extract::parse_number(*it->second.value);
  if (!parsed) {
    return std::unexpected(std::string("field '") + name + "' is not numeric: \"" +
                           *it->second.value + "\"");
  }
  return *parsed;
}

}  // namespace

invoscan::core::VerificationReport VerificationEngine::verify(
    const invoscan::core::FieldSet& fields,
    const std::vector<invoscan::core::LineItem>& line_items) const {
  double computed_subtotal = 0.0;
  for (const auto& item : line_items) computed_subtotal += item.row_total;

  const auto subtotal = coerce(fields, fn::kSubtotal);
  const auto gst = coerce(fields, fn::kGstAmount);
  const auto discount = coerce(fields, fn::kDiscount);
  const auto total = coerce(fields, fn::kTotal);
  for (const auto* v : {&subtotal, &gst, &discount, &total}) {
    if (!*v) {
      return invoscan::core::VerificationReport::failure("Value extraction error: " + v->error());
    }
  }

  const double computed_total = computed_subtotal + *gst - *discount;
  const double error_margin = std::fabs(computed_total - *total);

  invoscan::core::VerificationReport report;
  report.verified = error_margin < config_.margin_tolerance;
  report.confidence =
      round_to(std::max(0.0, 1.0 - error_margin / (*total + config_.epsilon)), 3);
  report.error_margin = round_to(error_margin, 2);

  invoscan::core::VerificationFigures figures;
  figures.extracted_subtotal = *subtotal;
  figures.computed_subtotal = round_to(computed_subtotal, 2);
  figures.extracted_total = *total;
  figures.computed_total = round_to(computed_total, 2);
  figures.gst = *gst;
  figures.discount = *discount;
  report.figures = figures;
  return report;
}

}  // namespace invoscan::verify
