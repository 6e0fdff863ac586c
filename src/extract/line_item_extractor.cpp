#include <invoscan/extract/line_item_extractor.hpp>
#include <invoscan/extract/numeric.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace invoscan::extract {

std::optional<invoscan::core::LineItem> LineItemExtractor::try_row_at(
    const std::vector<invoscan::core::WordRecord>& words, std::size_t start) const {
  if (start >= words.size() || !is_all_digits(words[start].text)) {
    return std::nullopt;
  }
  const std::size_t end = std::min(words.size(), start + config_.window_size);

  std::vector<const std::string*> numeric;
  for (std::size_t i = start; i < end; ++i) {
    if (has_digit(words[i].text)) numeric.push_back(&words[i].text);
  }
  // Needs qty, unit price and row total after the row start.
  if (numeric.size() < config_.min_numeric_tokens || numeric.size() < 4) {
    return std::nullopt;
  }

  const auto qty = parse_amount(*numeric[1]);
  const auto unit_price = parse_amount(*numeric[2]);
  const auto row_total = parse_amount(*numeric[3]);
  if (!qty || !unit_price || !row_total) {
    return std::nullopt;
  }

  invoscan::core::LineItem item;
  for (std::size_t off = 1; off <= 2 && start + off < end; ++off) {
    if (off > 1) item.description.push_back(' ');
    item.description += words[start + off].text;
  }
  item.qty = *qty;
  item.unit_price = *unit_price;
  item.row_total = *row_total;
  item.valid = std::fabs(item.qty * item.unit_price - item.row_total) < config_.row_tolerance;
  return item;
}

std::vector<invoscan::core::LineItem> LineItemExtractor::extract(
    const std::vector<invoscan::core::WordRecord>& words) const {
  std::vector<invoscan::core::LineItem> items;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (auto item = try_row_at(words, i)) {
      items.push_back(std::move(*item));
    }
  }
  return items;
}

}  // namespace invoscan::extract
