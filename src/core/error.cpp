#include <invoscan/core/error.hpp>

namespace invoscan::core {

const char* to_string(ExtractionError e) noexcept {
  switch (e) {
    case ExtractionError::None:
      return "None";
    case ExtractionError::MissingInput:
      return "MissingInput";
    case ExtractionError::MalformedInput:
      return "MalformedInput";
    case ExtractionError::WriteFailed:
      return "WriteFailed";
    case ExtractionError::TaggerFailed:
      return "TaggerFailed";
    default:
      return "Unknown";
  }
}

}  // namespace invoscan::core
