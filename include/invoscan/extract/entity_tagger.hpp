#pragma once

#include <invoscan/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace invoscan::extract {

/// Entity categories the field extractor consumes.
enum class EntityCategory : std::uint8_t {
  Organization,  // organizations and persons
  Location,      // geo-political entities and locations
};

/// One tagged span of the input text, in order of appearance.
struct TaggedSpan {
  std::string text;
  EntityCategory category{EntityCategory::Organization};

  bool operator==(const TaggedSpan&) const = default;
};

/// Abstract named-entity tagger: text -> ordered spans.
/// Implement tag(); optionally override warmup().
/// tag() may be called from several batch workers at once; implementations
/// must not share mutable scratch state between calls.
class IEntityTagger {
 public:
  virtual ~IEntityTagger() = default;

  [[nodiscard]] virtual std::expected<std::vector<TaggedSpan>, invoscan::core::ExtractionError>
  tag(std::string_view text) = 0;

  /// Optional: warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace invoscan::extract
