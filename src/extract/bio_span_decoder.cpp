#include <invoscan/extract/bio_span_decoder.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace invoscan::extract {

namespace {

struct ParsedLabel {
  char marker{'O'};  // 'B', 'I' or 'O'
  std::string type;
};

ParsedLabel parse_label(std::string_view label) {
  ParsedLabel p;
  if (label.size() >= 2 && (label[1] == '-' || label[1] == '_')) {
    const char m = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    if (m == 'B' || m == 'I') {
      p.marker = m;
      p.type.assign(label.substr(2));
      return p;
    }
  }
  // Bare types ("ORG") are treated as a continuation.
  if (!label.empty() && label != "O") {
    p.marker = 'I';
    p.type.assign(label);
  }
  return p;
}

}  // namespace

std::optional<EntityCategory> category_for_entity_type(std::string_view type) {
  std::string upper(type);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "ORG" || upper == "PER" || upper == "PERSON") {
    return EntityCategory::Organization;
  }
  if (upper == "LOC" || upper == "GPE") {
    return EntityCategory::Location;
  }
  return std::nullopt;
}

std::vector<TaggedSpan> BioSpanDecoder::decode(
    const std::vector<std::string>& tokens,
    const std::vector<std::string>& labels) const {
  std::vector<TaggedSpan> out;
  const std::size_t n = std::min(tokens.size(), labels.size());

  std::string open_type;
  std::string open_text;
  auto close = [&]() {
    if (!open_type.empty()) {
      if (auto cat = category_for_entity_type(open_type)) {
        out.push_back(TaggedSpan{std::move(open_text), *cat});
      }
    }
    open_type.clear();
    open_text.clear();
  };

  for (std::size_t i = 0; i < n; ++i) {
    const ParsedLabel p = parse_label(labels[i]);
    if (p.marker == 'O') {
      close();
      continue;
    }
    if (p.marker == 'B' || p.type != open_type) {
      close();
      open_type = p.type;
      open_text = tokens[i];
      continue;
    }
    open_text.push_back(' ');
    open_text += tokens[i];
  }
  close();
  return out;
}

}  // namespace invoscan::extract
