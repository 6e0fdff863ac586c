#pragma once

#include <optional>
#include <string>
#include <utility>

namespace invoscan::core {

/// Figures of a successful arithmetic cross-check. Computed values are
/// rounded for display; extracted inputs are kept as parsed for audit.
struct VerificationFigures {
  double extracted_subtotal{0.0};
  double computed_subtotal{0.0};
  double extracted_total{0.0};
  double computed_total{0.0};
  double gst{0.0};
  double discount{0.0};

  bool operator==(const VerificationFigures&) const = default;
};

/// Result of verifying one document.
/// Success: figures and error_margin set, error empty.
/// Failure: error set, figures and error_margin empty, verified false, confidence 0.
struct VerificationReport {
  bool verified{false};
  double confidence{0.0};
  std::optional<double> error_margin;
  std::optional<std::string> error;
  std::optional<VerificationFigures> figures;

  [[nodiscard]] bool failed() const noexcept { return error.has_value(); }

  [[nodiscard]] static VerificationReport failure(std::string message) {
    VerificationReport r;
    r.error = std::move(message);
    return r;
  }

  bool operator==(const VerificationReport&) const = default;
};

}  // namespace invoscan::core
