#pragma once

#include <invoscan/extract/line_item_extractor.hpp>
#include <invoscan/verify/verification_engine.hpp>
#include <cstddef>
#include <string>

namespace invoscan::app {

/// Entity tagger type: mock (fixed spans) or onnx (token-classification model).
enum class TaggerBackendType {
  Mock,
  Onnx,
};

/// Batch configuration: directories, tagger, thresholds, workers.
struct AppConfig {
  std::string ocr_dir{"output/ocr"};
  std::string output_dir{"output"};

  TaggerBackendType tagger_backend{TaggerBackendType::Mock};
  std::string tagger_model_path;
  std::string tagger_vocab_path;
  std::string tagger_labels_path;
  std::size_t tagger_max_sequence_length{512};

  invoscan::extract::LineItemConfig line_items{};
  invoscan::verify::VerificationConfig verification{};

  std::size_t num_workers{0};  // 0 = hardware concurrency
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// A missing file yields the defaults. Throws std::invalid_argument /
/// std::out_of_range when a numeric value does not parse.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

/// Parse "mock" / "onnx". Returns false for anything else.
bool parse_tagger_backend(const std::string& name, TaggerBackendType& out);

}  // namespace invoscan::app
