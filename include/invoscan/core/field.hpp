#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace invoscan::core {

/// One extracted header datum.
/// Invariant: present == value.has_value(); confidence == 0 when absent.
struct FieldValue {
  std::optional<std::string> value;
  double confidence{0.0};
  bool present{false};

  [[nodiscard]] static FieldValue present_value(std::string v, double confidence) {
    return FieldValue{std::move(v), confidence, true};
  }
  [[nodiscard]] static FieldValue absent() { return FieldValue{}; }

  bool operator==(const FieldValue&) const = default;
};

/// Field name -> value, ordered by name so serialized output is stable.
using FieldSet = std::map<std::string, FieldValue>;

namespace field_names {

inline constexpr const char* kInvoiceNumber = "invoice_number";
inline constexpr const char* kDate = "date";
inline constexpr const char* kGstNumber = "gst_number";
inline constexpr const char* kPoNumber = "po_number";
inline constexpr const char* kBillTo = "bill_to";
inline constexpr const char* kShipTo = "ship_to";
inline constexpr const char* kBillToAddress = "bill_to_address";
inline constexpr const char* kShipToAddress = "ship_to_address";

// Supplied by an upstream amounts stage; read by verification only.
inline constexpr const char* kSubtotal = "subtotal";
inline constexpr const char* kGstAmount = "gst_amount";
inline constexpr const char* kDiscount = "discount";
inline constexpr const char* kTotal = "total";

}  // namespace field_names

}  // namespace invoscan::core
