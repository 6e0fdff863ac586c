#pragma once

#include <invoscan/core/field.hpp>
#include <invoscan/extract/entity_tagger.hpp>
#include <boost/regex.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace invoscan::extract {

/// Confidence assigned to a regex hit.
inline constexpr double kRegexConfidence = 0.95;
/// Confidence assigned to bill_to / ship_to taken from organization spans.
inline constexpr double kPartyConfidence = 0.8;
/// Confidence assigned to addresses taken from location spans.
inline constexpr double kAddressConfidence = 0.7;

/// Ordered candidate patterns for one header field. Capture group 1 is the value.
/// Patterns are tried in order; the first one that matches wins.
struct FieldRule {
  std::string name;
  std::vector<boost::regex> patterns;
};

/// Builds a rule from pattern strings, compiled case-insensitive.
/// Throws boost::regex_error on an invalid pattern.
[[nodiscard]] FieldRule make_field_rule(std::string name,
                                        const std::vector<std::string>& patterns);

/// invoice_number, date, gst_number, po_number with their patterns.
[[nodiscard]] std::vector<FieldRule> default_field_rules();

/// One FieldValue per rule: first matching pattern's group 1, trimmed, or absent.
/// A pattern that exceeds the matcher's complexity limit on this text counts
/// as no match.
[[nodiscard]] invoscan::core::FieldSet extract_regex_fields(
    std::string_view text, const std::vector<FieldRule>& rules);

/// Positional party selection: bill_to / ship_to are the first / second
/// organization span, bill_to_address / ship_to_address the first / second
/// location span. Spans are neither deduplicated nor disambiguated.
[[nodiscard]] invoscan::core::FieldSet select_entity_fields(
    const std::vector<TaggedSpan>& spans);

/// Document text -> header FieldSet (regex fields plus entity fields).
class FieldExtractor {
 public:
  explicit FieldExtractor(std::unique_ptr<IEntityTagger> tagger,
                          std::vector<FieldRule> rules = default_field_rules());

  /// Never fails: unmatched fields and a failing tagger yield absent values.
  [[nodiscard]] invoscan::core::FieldSet extract(std::string_view text) const;

  [[nodiscard]] const std::vector<FieldRule>& rules() const noexcept { return rules_; }

 private:
  std::unique_ptr<IEntityTagger> tagger_;
  std::vector<FieldRule> rules_;
};

}  // namespace invoscan::extract
