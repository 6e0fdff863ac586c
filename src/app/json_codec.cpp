#include <invoscan/app/json_codec.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace invoscan::app {

namespace {

using invoscan::core::ExtractionError;

// Box coordinates: non-finite values read as 0, the rest clamped into int range.
int int_or_zero(const Json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return 0;
  const double v = it->get<double>();
  if (!std::isfinite(v)) return 0;
  constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
  constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
  return static_cast<int>(std::clamp(v, kMin, kMax));
}

std::optional<double> number_at(const Json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return std::nullopt;
  return it->get<double>();
}

}  // namespace

Json words_to_json(const std::vector<invoscan::core::WordRecord>& words) {
  Json out = Json::array();
  for (const auto& w : words) {
    out.push_back(Json{{"text", w.text},
                       {"left", w.left},
                       {"top", w.top},
                       {"width", w.width},
                       {"height", w.height},
                       {"conf", w.confidence}});
  }
  return out;
}

std::expected<std::vector<invoscan::core::WordRecord>, ExtractionError>
words_from_json(const Json& j) {
  if (!j.is_array()) return std::unexpected(ExtractionError::MalformedInput);
  std::vector<invoscan::core::WordRecord> words;
  words.reserve(j.size());
  for (const auto& item : j) {
    if (!item.is_object()) return std::unexpected(ExtractionError::MalformedInput);
    const auto text = item.find("text");
    if (text == item.end() || !text->is_string()) {
      return std::unexpected(ExtractionError::MalformedInput);
    }
    invoscan::core::WordRecord w;
    w.text = text->get<std::string>();
    w.left = int_or_zero(item, "left");
    w.top = int_or_zero(item, "top");
    w.width = int_or_zero(item, "width");
    w.height = int_or_zero(item, "height");
    w.confidence = number_at(item, "conf").value_or(0.0);
    words.push_back(std::move(w));
  }
  return words;
}

Json field_set_to_json(const invoscan::core::FieldSet& fields) {
  Json out = Json::object();
  for (const auto& [name, f] : fields) {
    Json v = Json::object();
    v["value"] = f.value ? Json(*f.value) : Json(nullptr);
    v["confidence"] = f.confidence;
    v["present"] = f.present;
    out[name] = std::move(v);
  }
  return out;
}

std::expected<invoscan::core::FieldSet, ExtractionError> field_set_from_json(const Json& j) {
  if (!j.is_object()) return std::unexpected(ExtractionError::MalformedInput);
  invoscan::core::FieldSet fields;
  for (const auto& [name, v] : j.items()) {
    if (!v.is_object()) return std::unexpected(ExtractionError::MalformedInput);
    invoscan::core::FieldValue f;
    const auto value = v.find("value");
    if (value != v.end() && !value->is_null()) {
      f.value = value->is_string() ? value->get<std::string>() : value->dump();
    }
    f.present = f.value.has_value();
    f.confidence = f.present ? number_at(v, "confidence").value_or(0.0) : 0.0;
    fields[name] = std::move(f);
  }
  return fields;
}

Json line_items_to_json(const std::vector<invoscan::core::LineItem>& items) {
  Json out = Json::array();
  for (const auto& item : items) {
    out.push_back(Json{{"description", item.description},
                       {"qty", item.qty},
                       {"unit_price", item.unit_price},
                       {"row_total", item.row_total},
                       {"valid", item.valid}});
  }
  return out;
}

std::expected<std::vector<invoscan::core::LineItem>, ExtractionError>
line_items_from_json(const Json& j) {
  if (!j.is_array()) return std::unexpected(ExtractionError::MalformedInput);
  std::vector<invoscan::core::LineItem> items;
  items.reserve(j.size());
  for (const auto& v : j) {
    if (!v.is_object()) return std::unexpected(ExtractionError::MalformedInput);
    invoscan::core::LineItem item;
    if (const auto d = v.find("description"); d != v.end() && d->is_string()) {
      item.description = d->get<std::string>();
    }
    const auto qty = number_at(v, "qty");
    const auto unit_price = number_at(v, "unit_price");
    const auto row_total = number_at(v, "row_total");
    if (!qty || !unit_price || !row_total) {
      return std::unexpected(ExtractionError::MalformedInput);
    }
    item.qty = *qty;
    item.unit_price = *unit_price;
    item.row_total = *row_total;
    if (const auto valid = v.find("valid"); valid != v.end() && valid->is_boolean()) {
      item.valid = valid->get<bool>();
    }
    items.push_back(std::move(item));
  }
  return items;
}

Json report_to_json(const invoscan::core::VerificationReport& report) {
  Json out = Json::object();
  if (report.failed() || !report.figures) {
    out["verified"] = false;
    out["error"] = report.error.value_or("verification figures missing");
    out["confidence"] = 0.0;
    out["error_margin"] = nullptr;
    return out;
  }
  const auto& f = *report.figures;
  out["verified"] = report.verified;
  out["confidence"] = report.confidence;
  out["error_margin"] = report.error_margin ? Json(*report.error_margin) : Json(nullptr);
  out["extracted_subtotal"] = f.extracted_subtotal;
  out["computed_subtotal"] = f.computed_subtotal;
  out["extracted_total"] = f.extracted_total;
  out["computed_total"] = f.computed_total;
  out["gst"] = f.gst;
  out["discount"] = f.discount;
  return out;
}

std::expected<invoscan::core::VerificationReport, ExtractionError> report_from_json(const Json& j) {
  if (!j.is_object()) return std::unexpected(ExtractionError::MalformedInput);
  if (const auto err = j.find("error"); err != j.end() && err->is_string()) {
    return invoscan::core::VerificationReport::failure(err->get<std::string>());
  }

  const auto verified = j.find("verified");
  if (verified == j.end() || !verified->is_boolean()) {
    return std::unexpected(ExtractionError::MalformedInput);
  }
  invoscan::core::VerificationReport report;
  report.verified = verified->get<bool>();
  report.confidence = number_at(j, "confidence").value_or(0.0);
  report.error_margin = number_at(j, "error_margin");

  invoscan::core::VerificationFigures f;
  f.extracted_subtotal = number_at(j, "extracted_subtotal").value_or(0.0);
  f.computed_subtotal = number_at(j, "computed_subtotal").value_or(0.0);
  f.extracted_total = number_at(j, "extracted_total").value_or(0.0);
  f.computed_total = number_at(j, "computed_total").value_or(0.0);
  f.gst = number_at(j, "gst").value_or(0.0);
  f.discount = number_at(j, "discount").value_or(0.0);
  report.figures = f;
  return report;
}

}  // namespace invoscan::app
