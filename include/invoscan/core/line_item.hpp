#pragma once

#include <string>

namespace invoscan::core {

/// One reconstructed row of the itemized table.
/// valid is |qty * unit_price - row_total| below the row tolerance.
struct LineItem {
  std::string description;
  double qty{0.0};
  double unit_price{0.0};
  double row_total{0.0};
  bool valid{false};

  bool operator==(const LineItem&) const = default;
};

}  // namespace invoscan::core
