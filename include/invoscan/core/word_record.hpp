#pragma once

#include <string>

namespace invoscan::core {

/// One OCR-recognized token: text, pixel bounding box, engine confidence.
struct WordRecord {
  std::string text;
  int left{0};
  int top{0};
  int width{0};
  int height{0};
  double confidence{0.0};  // engine confidence as reported ("conf")
};

}  // namespace invoscan::core
