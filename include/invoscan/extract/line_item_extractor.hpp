#pragma once

#include <invoscan/core/line_item.hpp>
#include <invoscan/core/word_record.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace invoscan::extract {

/// Row reconstruction parameters.
struct LineItemConfig {
  std::size_t window_size{8};         // candidate word plus lookahead
  std::size_t min_numeric_tokens{3};  // digit-bearing tokens needed in the window
  double row_tolerance{2.0};          // |qty * unit_price - row_total| below this is valid
};

/// Rebuilds itemized rows from an ordered word sequence.
///
/// Every all-digit word (serial / HSN code) starts a candidate. The window is
/// that word and the next window_size - 1 words; its digit-bearing tokens are
/// the numeric tokens, the candidate itself being the first. Numeric tokens
/// 2, 3, 4 are qty, unit price and row total; description is the text at
/// window offsets 1 and 2. Candidates that fail are dropped and the scan
/// resumes at the next word, so windows may overlap.
class LineItemExtractor {
 public:
  LineItemExtractor() = default;
  explicit LineItemExtractor(LineItemConfig config) : config_(config) {}

  /// Never fails; returns rows in acceptance order, possibly none.
  [[nodiscard]] std::vector<invoscan::core::LineItem> extract(
      const std::vector<invoscan::core::WordRecord>& words) const;

  /// Attempts a row starting at words[start]; nullopt if rejected.
  [[nodiscard]] std::optional<invoscan::core::LineItem> try_row_at(
      const std::vector<invoscan::core::WordRecord>& words, std::size_t start) const;

  [[nodiscard]] const LineItemConfig& config() const noexcept { return config_; }

 private:
  LineItemConfig config_;
};

}  // namespace invoscan::extract
