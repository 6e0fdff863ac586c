#pragma once

#include <invoscan/app/config.hpp>
#include <invoscan/app/document_store.hpp>
#include <invoscan/core/document.hpp>
#include <invoscan/core/error.hpp>
#include <invoscan/core/field.hpp>
#include <invoscan/core/line_item.hpp>
#include <invoscan/core/verification_report.hpp>
#include <invoscan/extract/entity_tagger.hpp>
#include <invoscan/extract/field_extractor.hpp>
#include <invoscan/extract/line_item_extractor.hpp>
#include <invoscan/verify/verification_engine.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace invoscan::app {

/// Which part of the per-document work to run.
enum class Stage {
  Fields,
  LineItems,
  Verify,
  All,
};

/// Parse "fields" / "lineitems" / "verify" / "all". Returns false for anything else.
bool parse_stage(const std::string& name, Stage& out);
const char* to_string(Stage stage) noexcept;

enum class OutcomeStatus {
  Succeeded,
  Skipped,  // required input missing; nothing written
  Failed,
};

/// What happened to one document.
struct DocumentOutcome {
  std::string prefix;
  OutcomeStatus status{OutcomeStatus::Succeeded};
  invoscan::core::ExtractionError error{invoscan::core::ExtractionError::None};
  std::string message;  // exception text when Failed by exception
  std::size_t present_fields{0};
  std::size_t line_items{0};
  std::optional<invoscan::core::VerificationReport> report;
};

/// Runs field extraction, line-item extraction and verification for one
/// document at a time, reading and writing through a DocumentStore.
/// Thread-safety: run() on distinct prefixes may be called concurrently
/// provided the tagger's tag() is safe to call concurrently.
class DocumentProcessor {
 public:
  DocumentProcessor(DocumentStore store,
                    std::unique_ptr<invoscan::extract::IEntityTagger> tagger,
                    invoscan::extract::LineItemConfig line_item_config = {},
                    invoscan::verify::VerificationConfig verification_config = {});

  /// Load pages, extract header fields, write <prefix>_fields.json.
  [[nodiscard]] std::expected<invoscan::core::FieldSet, invoscan::core::ExtractionError>
  extract_fields(const std::string& prefix) const;

  /// Load pages, extract rows, write <prefix>_lineitems.json.
  [[nodiscard]] std::expected<std::vector<invoscan::core::LineItem>, invoscan::core::ExtractionError>
  extract_line_items(const std::string& prefix) const;

  /// Read fields and line items back, verify, write the report.
  /// MissingInput (and no output) if either file is absent.
  [[nodiscard]] std::expected<invoscan::core::VerificationReport, invoscan::core::ExtractionError>
  verify(const std::string& prefix) const;

  /// Run the given stage(s). Does not throw for expected failures; exceptions
  /// from collaborators propagate to the batch driver.
  [[nodiscard]] DocumentOutcome run(const std::string& prefix, Stage stage) const;

  [[nodiscard]] const DocumentStore& store() const noexcept { return store_; }

 private:
  [[nodiscard]] std::expected<invoscan::core::FieldSet, invoscan::core::ExtractionError>
  write_fields(const invoscan::core::Document& doc) const;
  [[nodiscard]] std::expected<std::vector<invoscan::core::LineItem>, invoscan::core::ExtractionError>
  write_line_items(const invoscan::core::Document& doc) const;

  DocumentStore store_;
  invoscan::extract::FieldExtractor field_extractor_;
  invoscan::extract::LineItemExtractor line_item_extractor_;
  invoscan::verify::VerificationEngine verification_engine_;
};

/// Builds the tagger the config asks for. Throws std::runtime_error when
/// the backend is unavailable or its files are not configured. The mock
/// backend tags nothing; choosing it logs a warning.
[[nodiscard]] std::unique_ptr<invoscan::extract::IEntityTagger> make_entity_tagger(
    const AppConfig& config);

/// DocumentStore, tagger and thresholds from config.
[[nodiscard]] DocumentProcessor make_document_processor(const AppConfig& config);

}  // namespace invoscan::app
