#pragma once

#include <invoscan/extract/entity_tagger.hpp>
#include <utility>
#include <vector>

namespace invoscan::extract {

/// Tagger that returns configured spans regardless of input (for tests/demo).
class MockEntityTagger : public IEntityTagger {
 public:
  MockEntityTagger() = default;
  explicit MockEntityTagger(std::vector<TaggedSpan> spans) : spans_(std::move(spans)) {}

  /// Set spans to return on subsequent tag() calls.
  void set_spans(std::vector<TaggedSpan> spans);

  /// Make subsequent tag() calls fail with TaggerFailed.
  void set_failing(bool failing) noexcept { failing_ = failing; }

  [[nodiscard]] std::expected<std::vector<TaggedSpan>, invoscan::core::ExtractionError>
  tag(std::string_view text) override;

 private:
  std::vector<TaggedSpan> spans_;
  bool failing_{false};
};

}  // namespace invoscan::extract
