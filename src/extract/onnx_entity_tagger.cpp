#include <invoscan/extract/onnx_entity_tagger.hpp>

#ifdef INVOSCAN_HAS_ONNXRUNTIME

#include <invoscan/core/error.hpp>
#include <invoscan/extract/bio_span_decoder.hpp>
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <expected>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace invoscan::extract {

namespace {

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

std::vector<std::string> read_lines(const std::string& path, const char* what) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error(std::string("OnnxEntityTagger: cannot open ") + what + " file " + path);
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> split_whitespace(std::string_view text) {
  std::vector<std::string> tokens;
  std::istringstream in{std::string(text)};
  std::string tok;
  while (in >> tok) tokens.push_back(tok);
  return tokens;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

struct OnnxEntityTagger::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "invoscan"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_ids_name;
  std::string attention_mask_name;  // empty if the model takes input_ids only
  std::string output_name;

  std::unordered_map<std::string, std::int64_t> vocab;
  std::int64_t unk_id{0};
  std::vector<std::string> labels;
  std::size_t max_sequence_length{512};
  BioSpanDecoder decoder;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::int64_t lookup(const std::string& token) const {
    if (auto it = vocab.find(token); it != vocab.end()) return it->second;
    if (auto it = vocab.find(to_lower(token)); it != vocab.end()) return it->second;
    return unk_id;
  }

  /// Runs one chunk; appends one label per token to out_labels.
  bool run_chunk(const std::vector<std::string>& tokens,
                 std::size_t begin,
                 std::size_t end,
                 std::vector<std::string>& out_labels) {
    const std::size_t n = end - begin;
    std::vector<std::int64_t> ids(n);
    std::vector<std::int64_t> mask(n, 1);
    for (std::size_t i = 0; i < n; ++i) ids[i] = lookup(tokens[begin + i]);

    const std::array<int64_t, 2> shape{1, static_cast<int64_t>(n)};
    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    std::vector<Ort::Value> inputs;
    std::vector<const char*> input_names;
    inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(
        mem_info, ids.data(), ids.size(), shape.data(), shape.size()));
    input_names.push_back(input_ids_name.c_str());
    if (!attention_mask_name.empty()) {
      inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(
          mem_info, mask.data(), mask.size(), shape.data(), shape.size()));
      input_names.push_back(attention_mask_name.c_str());
    }
    const char* output_names[] = {output_name.c_str()};

    std::vector<Ort::Value> outputs;
    try {
      Ort::RunOptions run_options;
      outputs = session.Run(run_options, input_names.data(), inputs.data(), inputs.size(),
                            output_names, 1);
    } catch (const Ort::Exception&) {
      return false;
    }
    if (outputs.size() != 1u) return false;

    const auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    // logits [1, N, L] or [N, L]
    int64_t rows = 0;
    int64_t num_labels = 0;
    if (out_shape.size() == 3u && out_shape[0] == 1) {
      rows = out_shape[1];
      num_labels = out_shape[2];
    } else if (out_shape.size() == 2u) {
      rows = out_shape[0];
      num_labels = out_shape[1];
    }
    if (rows != static_cast<int64_t>(n) || num_labels <= 0 ||
        static_cast<std::size_t>(num_labels) > labels.size()) {
      return false;
    }

    const float* logits = outputs[0].GetTensorData<float>();
    for (int64_t r = 0; r < rows; ++r) {
      const float* row = logits + r * num_labels;
      const auto best = std::max_element(row, row + num_labels) - row;
      out_labels.push_back(labels[static_cast<std::size_t>(best)]);
    }
    return true;
  }
};

OnnxEntityTagger::OnnxEntityTagger(std::string model_path,
                                   std::string vocab_path,
                                   std::string labels_path,
                                   std::size_t max_sequence_length)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  const size_t num_inputs = impl_->session.GetInputCount();
  if (num_inputs == 0 || num_inputs > 2u) {
    throw std::runtime_error("OnnxEntityTagger: expected 1 or 2 inputs (input_ids[, attention_mask])");
  }
  impl_->input_ids_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  if (num_inputs == 2u) {
    impl_->attention_mask_name = impl_->session.GetInputNameAllocated(1, allocator).get();
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxEntityTagger: model has no outputs");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  const auto vocab_lines = read_lines(vocab_path, "vocab");
  for (std::size_t i = 0; i < vocab_lines.size(); ++i) {
    impl_->vocab.emplace(vocab_lines[i], static_cast<std::int64_t>(i));
  }
  if (auto it = impl_->vocab.find("[UNK]"); it != impl_->vocab.end()) {
    impl_->unk_id = it->second;
  }

  impl_->labels = read_lines(labels_path, "labels");
  impl_->labels.erase(std::remove(impl_->labels.begin(), impl_->labels.end(), std::string{}),
                      impl_->labels.end());
  if (impl_->labels.empty()) {
    throw std::runtime_error("OnnxEntityTagger: labels file is empty: " + labels_path);
  }
  impl_->max_sequence_length = max_sequence_length > 0 ? max_sequence_length : 512;
}

OnnxEntityTagger::~OnnxEntityTagger() = default;

std::expected<std::vector<TaggedSpan>, invoscan::core::ExtractionError>
OnnxEntityTagger::tag(std::string_view text) {
  const std::vector<std::string> tokens = split_whitespace(text);
  if (tokens.empty()) return std::vector<TaggedSpan>{};

  std::vector<std::string> token_labels;
  token_labels.reserve(tokens.size());
  for (std::size_t begin = 0; begin < tokens.size(); begin += impl_->max_sequence_length) {
    const std::size_t end = std::min(tokens.size(), begin + impl_->max_sequence_length);
    if (!impl_->run_chunk(tokens, begin, end, token_labels)) {
      return std::unexpected(invoscan::core::ExtractionError::TaggerFailed);
    }
  }
  return impl_->decoder.decode(tokens, token_labels);
}

void OnnxEntityTagger::warmup() {
  (void)tag("Invoice");
}

std::size_t OnnxEntityTagger::vocab_size() const noexcept { return impl_->vocab.size(); }

std::size_t OnnxEntityTagger::label_count() const noexcept { return impl_->labels.size(); }

}  // namespace invoscan::extract

#endif  // INVOSCAN_HAS_ONNXRUNTIME
