#pragma once

namespace invoscan::core {

/// Document-level error codes; used with std::expected for recoverable failures.
/// Field-level misses (no pattern matched, too few entities, unparsable rows,
/// non-numeric totals) are not errors: they degrade to absent values.
enum class ExtractionError {
  None = 0,
  MissingInput,
  MalformedInput,
  WriteFailed,
  TaggerFailed,
};

/// Short name for logs and CLI output.
const char* to_string(ExtractionError e) noexcept;

}  // namespace invoscan::core
