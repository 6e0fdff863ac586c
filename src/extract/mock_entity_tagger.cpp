#include <invoscan/extract/mock_entity_tagger.hpp>
#include <invoscan/core/error.hpp>

namespace invoscan::extract {

void MockEntityTagger::set_spans(std::vector<TaggedSpan> spans) {
  spans_ = std::move(spans);
}

std::expected<std::vector<TaggedSpan>, invoscan::core::ExtractionError>
MockEntityTagger::tag(std::string_view /*text*/) {
  if (failing_) {
    return std::unexpected(invoscan::core::ExtractionError::TaggerFailed);
  }
  return spans_;
}

}  // namespace invoscan::extract
