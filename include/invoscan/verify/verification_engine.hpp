#pragma once

#include <invoscan/core/field.hpp>
#include <invoscan/core/line_item.hpp>
#include <invoscan/core/verification_report.hpp>
#include <vector>

namespace invoscan::verify {

/// Reconciliation thresholds. Both are absolute, not scaled to the invoice amount.
struct VerificationConfig {
  double margin_tolerance{1.0};  // verified when error_margin is below this
  double epsilon{1e-5};          // keeps the confidence ratio finite for a zero total
};

/// Cross-checks extracted totals against the sum of line-item row totals:
///   computed_total = sum(row_total) + gst_amount - discount
///   error_margin   = |computed_total - total|
///   confidence     = max(0, 1 - error_margin / (total + epsilon))
/// subtotal, gst_amount, discount and total must all be present and numeric;
/// otherwise the result is a failure report, never an exception.
/// Pure: equal inputs give equal reports.
class VerificationEngine {
 public:
  VerificationEngine() = default;
  explicit VerificationEngine(VerificationConfig config) : config_(config) {}

  [[nodiscard]] invoscan::core::VerificationReport verify(
      const invoscan::core::FieldSet& fields,
      const std::vector<invoscan::core::LineItem>& line_items) const;

  [[nodiscard]] const VerificationConfig& config() const noexcept { return config_; }

 private:
  VerificationConfig config_;
};

}  // namespace invoscan::verify
