#include <invoscan/extract/field_extractor.hpp>
#include <invoscan/core/logging.hpp>
#include <invoscan/core/error.hpp>
#include <invoscan/core/field.hpp>
#include <boost/regex.hpp>
#include <stdexcept>
#include <string>

namespace invoscan::extract {

namespace {

namespace fn = invoscan::core::field_names;
using invoscan::core::FieldValue;

std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n\f\v");
  if (start == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(start, end - start + 1);
}

FieldValue nth_or_absent(const std::vector<std::string>& candidates,
                         std::size_t n,
                         double confidence) {
  if (n < candidates.size()) {
    return FieldValue::present_value(candidates[n], confidence);
  }
  return FieldValue::absent();
}

}  // namespace

FieldRule make_field_rule(std::string name, const std::vector<std::string>& patterns) {
  FieldRule rule;
  rule.name = std::move(name);
  rule.patterns.reserve(patterns.size());
  for (const auto& p : patterns) {
    rule.patterns.emplace_back(p, boost::regex::perl | boost::regex::icase);
  }
  return rule;
}

std::vector<FieldRule> default_field_rules() {
  std::vector<FieldRule> rules;
  rules.push_back(make_field_rule(fn::kInvoiceNumber,
                                  {R"(Invoice\s*No\.?\s*[:\-]?\s*([A-Za-z0-9\-]+))"}));
  rules.push_back(make_field_rule(fn::kDate,
                                  {R"(Date\s*[:\-]?\s*([0-9]{2,4}[-/][0-9]{1,2}[-/][0-9]{1,4}))"}));
  rules.push_back(make_field_rule(fn::kGstNumber,
                                  {R"(GSTIN\s*[:\-]?\s*([0-9A-Z]{15}))"}));
  rules.push_back(make_field_rule(fn::kPoNumber,
                                  {R"(PO\s*No\.?\s*[:\-]?\s*([A-Za-z0-9\-]+))"}));
  return rules;
}

invoscan::core::FieldSet extract_regex_fields(std::string_view text,
                                              const std::vector<FieldRule>& rules) {
  invoscan::core::FieldSet out;
  for (const auto& rule : rules) {
    FieldValue value = FieldValue::absent();
    for (const auto& pattern : rule.patterns) {
      boost::cmatch m;
      bool found = false;
      try {
        found = boost::regex_search(text.data(), text.data() + text.size(), m, pattern);
      } catch (const std::runtime_error& e) {
        invoscan::core::logger()->warn("pattern for '{}' abandoned: {}", rule.name, e.what());
        continue;
      }
      if (found && m.size() > 1) {
        value = FieldValue::present_value(trim(m[1].str()), kRegexConfidence);
        break;
      }
    }
    out[rule.name] = std::move(value);
  }
  return out;
}

invoscan::core::FieldSet select_entity_fields(const std::vector<TaggedSpan>& spans) {
  std::vector<std::string> orgs;
  std::vector<std::string> locs;
  for (const auto& span : spans) {
    if (span.category == EntityCategory::Organization) {
      orgs.push_back(span.text);
    } else if (span.category == EntityCategory::Location) {
      locs.push_back(span.text);
    }
  }

  invoscan::core::FieldSet out;
  out[fn::kBillTo] = nth_or_absent(orgs, 0, kPartyConfidence);
  out[fn::kShipTo] = nth_or_absent(orgs, 1, kPartyConfidence);
  out[fn::kBillToAddress] = nth_or_absent(locs, 0, kAddressConfidence);
  out[fn::kShipToAddress] = nth_or_absent(locs, 1, kAddressConfidence);
  return out;
}

FieldExtractor::FieldExtractor(std::unique_ptr<IEntityTagger> tagger,
                               std::vector<FieldRule> rules)
    : tagger_(std::move(tagger)), rules_(std::move(rules)) {}

invoscan::core::FieldSet FieldExtractor::extract(std::string_view text) const {
  invoscan::core::FieldSet fields = extract_regex_fields(text, rules_);

  std::vector<TaggedSpan> spans;
  if (tagger_) {
    auto tagged = tagger_->tag(text);
    if (tagged) {
      spans = std::move(*tagged);
    } else {
      invoscan::core::logger()->warn("entity tagger failed ({}); party fields left absent",
                                    invoscan::core::to_string(tagged.error()));
    }
  }

  for (auto& [name, value] : select_entity_fields(spans)) {
    fields[name] = std::move(value);
  }
  return fields;
}

}  // namespace invoscan::extract
