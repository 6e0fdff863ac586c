#include <invoscan/app/config.hpp>
#include <fstream>
#include <string_view>

namespace invoscan::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

}  // namespace

bool parse_tagger_backend(const std::string& name, TaggerBackendType& out) {
  if (name == "mock") {
    out = TaggerBackendType::Mock;
    return true;
  }
  if (name == "onnx") {
    out = TaggerBackendType::Onnx;
    return true;
  }
  return false;
}

AppConfig default_config() {
  AppConfig c;
  c.ocr_dir = "output/ocr";
  c.output_dir = "output";
  c.tagger_backend = TaggerBackendType::Mock;
  c.tagger_max_sequence_length = 512;
  c.line_items = invoscan::extract::LineItemConfig{};
  c.verification = invoscan::verify::VerificationConfig{};
  c.num_workers = 0;
  c.log_level = "info";
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "ocr_dir") c.ocr_dir = value;
    else if (key == "output_dir") c.output_dir = value;
    else if (key == "tagger_backend") parse_tagger_backend(value, c.tagger_backend);
    else if (key == "tagger_model_path") c.tagger_model_path = value;
    else if (key == "tagger_vocab_path") c.tagger_vocab_path = value;
    else if (key == "tagger_labels_path") c.tagger_labels_path = value;
    else if (key == "tagger_max_sequence_length") c.tagger_max_sequence_length = std::stoul(value);
    else if (key == "margin_tolerance") c.verification.margin_tolerance = std::stod(value);
    else if (key == "confidence_epsilon") c.verification.epsilon = std::stod(value);
    else if (key == "row_tolerance") c.line_items.row_tolerance = std::stod(value);
    else if (key == "window_size") c.line_items.window_size = std::stoul(value);
    else if (key == "min_numeric_tokens") c.line_items.min_numeric_tokens = std::stoul(value);
    else if (key == "num_workers") c.num_workers = std::stoul(value);
    else if (key == "log_level") c.log_level = value;
  }
  return c;
}

}  // namespace invoscan::app
