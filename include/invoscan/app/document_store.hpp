#pragma once

#include <invoscan/core/document.hpp>
#include <invoscan/core/error.hpp>
#include <invoscan/core/field.hpp>
#include <invoscan/core/line_item.hpp>
#include <invoscan/core/verification_report.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace invoscan::app {

/// One OCR page file of a prefix.
struct PageFile {
  int number{0};
  std::filesystem::path path;
};

/// Splits "<prefix>_page_<n>_raw.json" into prefix and page number.
[[nodiscard]] std::optional<std::pair<std::string, int>> parse_page_file_name(
    const std::string& file_name);

/// Per-prefix artifact files.
///
/// Inputs (OCR dir):   <prefix>_page_<n>_raw.json
/// Outputs (out dir):  <prefix>_fields.json, <prefix>_lineitems.json,
///                     <prefix>_verifiability_report.json
/// Optional input (out dir): <prefix>_amounts.json, a field map holding the
/// subtotal / gst_amount / discount / total supplied by the amounts stage.
///
/// Each prefix owns disjoint paths, so distinct prefixes may be processed
/// from different threads without locking.
class DocumentStore {
 public:
  DocumentStore(std::filesystem::path ocr_dir, std::filesystem::path output_dir)
      : ocr_dir_(std::move(ocr_dir)), output_dir_(std::move(output_dir)) {}

  [[nodiscard]] const std::filesystem::path& ocr_dir() const noexcept { return ocr_dir_; }
  [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

  /// Sorted unique prefixes that have at least one OCR page file.
  [[nodiscard]] std::vector<std::string> discover_prefixes() const;

  /// Sorted unique prefixes that have a fields file in the output dir.
  [[nodiscard]] std::vector<std::string> discover_output_prefixes() const;

  /// Page files of a prefix in ascending page-number order.
  [[nodiscard]] std::vector<PageFile> page_files(const std::string& prefix) const;

  /// All pages of a prefix. MissingInput if there are none, MalformedInput on bad JSON.
  [[nodiscard]] std::expected<invoscan::core::Document, invoscan::core::ExtractionError>
  load_document(const std::string& prefix) const;

  [[nodiscard]] std::filesystem::path fields_path(const std::string& prefix) const;
  [[nodiscard]] std::filesystem::path line_items_path(const std::string& prefix) const;
  [[nodiscard]] std::filesystem::path report_path(const std::string& prefix) const;
  [[nodiscard]] std::filesystem::path amounts_path(const std::string& prefix) const;

  [[nodiscard]] std::expected<void, invoscan::core::ExtractionError> save_fields(
      const std::string& prefix, const invoscan::core::FieldSet& fields) const;
  [[nodiscard]] std::expected<void, invoscan::core::ExtractionError> save_line_items(
      const std::string& prefix, const std::vector<invoscan::core::LineItem>& items) const;
  [[nodiscard]] std::expected<void, invoscan::core::ExtractionError> save_report(
      const std::string& prefix, const invoscan::core::VerificationReport& report) const;

  /// MissingInput if the file does not exist.
  [[nodiscard]] std::expected<invoscan::core::FieldSet, invoscan::core::ExtractionError>
  load_fields(const std::string& prefix) const;
  [[nodiscard]] std::expected<std::vector<invoscan::core::LineItem>, invoscan::core::ExtractionError>
  load_line_items(const std::string& prefix) const;
  [[nodiscard]] std::expected<invoscan::core::VerificationReport, invoscan::core::ExtractionError>
  load_report(const std::string& prefix) const;

  /// Field map for verification: the fields file overlaid with the amounts
  /// file when one exists. MissingInput if the fields file is absent.
  [[nodiscard]] std::expected<invoscan::core::FieldSet, invoscan::core::ExtractionError>
  load_fields_for_verification(const std::string& prefix) const;

 private:
  std::filesystem::path ocr_dir_;
  std::filesystem::path output_dir_;
};

}  // namespace invoscan::app
