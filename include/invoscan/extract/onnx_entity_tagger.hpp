#pragma once

#include <invoscan/core/error.hpp>
#include <invoscan/extract/entity_tagger.hpp>
#include <cstddef>
#include <memory>
#include <string>

#ifdef INVOSCAN_HAS_ONNXRUNTIME

namespace invoscan::extract {

/// ONNX Runtime entity tagger: loads a token-classification model and implements IEntityTagger.
///
/// Expected model: one or two int64 inputs, input_ids [1,N] and optionally attention_mask [1,N],
/// and one float output of logits [1,N,L] where L is the number of labels.
/// Tokenization is whitespace splitting with a word-level vocabulary:
/// - **vocab file**: one token per line, id = zero-based line index; "[UNK]" if present is
///   used for unknown words, otherwise id 0.
/// - **labels file**: one BIO label per line ("O", "B-ORG", "I-LOC", ...), index = class id.
/// Texts longer than max_sequence_length tokens are tagged in consecutive chunks.
///
/// Session::Run is safe to call concurrently; tag() keeps all buffers per call.
class OnnxEntityTagger : public IEntityTagger {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param vocab_path Path to the vocabulary file.
  /// \param labels_path Path to the label file.
  /// \param max_sequence_length Tokens per inference call.
  OnnxEntityTagger(std::string model_path,
                   std::string vocab_path,
                   std::string labels_path,
                   std::size_t max_sequence_length = 512);

  ~OnnxEntityTagger() override;

  OnnxEntityTagger(const OnnxEntityTagger&) = delete;
  OnnxEntityTagger& operator=(const OnnxEntityTagger&) = delete;

  [[nodiscard]] std::expected<std::vector<TaggedSpan>, invoscan::core::ExtractionError>
  tag(std::string_view text) override;

  void warmup() override;

  [[nodiscard]] std::size_t vocab_size() const noexcept;
  [[nodiscard]] std::size_t label_count() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace invoscan::extract

#endif  // INVOSCAN_HAS_ONNXRUNTIME
