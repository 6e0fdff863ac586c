#pragma once

#include <invoscan/extract/entity_tagger.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace invoscan::extract {

/// Maps an entity type (label without B-/I- prefix) to a category.
/// ORG, PER, PERSON -> Organization; LOC, GPE -> Location; anything else -> nullopt.
[[nodiscard]] std::optional<EntityCategory> category_for_entity_type(std::string_view type);

/// Decodes per-token BIO labels (e.g. "B-ORG", "I-ORG", "O") into spans.
class BioSpanDecoder {
 public:
  /// tokens and labels are parallel; extra entries on either side are ignored.
  [[nodiscard]] std::vector<TaggedSpan> decode(
      const std::vector<std::string>& tokens,
      const std::vector<std::string>& labels) const;
};

}  // namespace invoscan::extract
