#include <invoscan/app/document_processor.hpp>
#include <invoscan/core/logging.hpp>
#include <invoscan/extract/mock_entity_tagger.hpp>
#ifdef INVOSCAN_HAS_ONNXRUNTIME
#include <invoscan/extract/onnx_entity_tagger.hpp>
#endif
#include <algorithm>
#include <stdexcept>

namespace invoscan::app {

namespace {

using invoscan::core::ExtractionError;

std::size_t count_present(const invoscan::core::FieldSet& fields) {
  return static_cast<std::size_t>(std::count_if(
      fields.begin(), fields.end(), [](const auto& kv) { return kv.second.present; }));
}

}  // namespace

bool parse_stage(const std::string& name, Stage& out) {
  if (name == "fields") out = Stage::Fields;
  else if (name == "lineitems") out = Stage::LineItems;
  else if (name == "verify") out = Stage::Verify;
  else if (name == "all") out = Stage::All;
  else return false;
  return true;
}

const char* to_string(Stage stage) noexcept {
  switch (stage) {
    case Stage::Fields:
      return "fields";
    case Stage::LineItems:
      return "lineitems";
    case Stage::Verify:
      return "verify";
    case Stage::All:
      return "all";
    default:
      return "unknown";
  }
}

DocumentProcessor::DocumentProcessor(DocumentStore store,
                                     std::unique_ptr<invoscan::extract::IEntityTagger> tagger,
                                     invoscan::extract::LineItemConfig line_item_config,
                                     invoscan::verify::VerificationConfig verification_config)
    : store_(std::move(store)),
      field_extractor_(std::move(tagger)),
      line_item_extractor_(line_item_config),
      verification_engine_(verification_config) {}

std::expected<invoscan::core::FieldSet, ExtractionError> DocumentProcessor::write_fields(
    const invoscan::core::Document& doc) const {
  invoscan::core::FieldSet fields = field_extractor_.extract(doc.full_text());
  if (auto saved = store_.save_fields(doc.prefix(), fields); !saved) {
    return std::unexpected(saved.error());
  }
  invoscan::core::logger()->info("{}: {} of {} fields present -> {}", doc.prefix(),
                                 count_present(fields), fields.size(),
                                 store_.fields_path(doc.prefix()).string());
  return fields;
}

std::expected<std::vector<invoscan::core::LineItem>, ExtractionError>
DocumentProcessor::write_line_items(const invoscan::core::Document& doc) const {
  auto items = line_item_extractor_.extract(doc.words());
  if (auto saved = store_.save_line_items(doc.prefix(), items); !saved) {
    return std::unexpected(saved.error());
  }
  invoscan::core::logger()->info("{}: {} line items from {} words -> {}", doc.prefix(),
                                 items.size(), doc.word_count(),
                                 store_.line_items_path(doc.prefix()).string());
  return items;
}

std::expected<invoscan::core::FieldSet, ExtractionError> DocumentProcessor::extract_fields(
    const std::string& prefix) const {
  auto doc = store_.load_document(prefix);
  if (!doc) return std::unexpected(doc.error());
  return write_fields(*doc);
}

std::expected<std::vector<invoscan::core::LineItem>, ExtractionError>
DocumentProcessor::extract_line_items(const std::string& prefix) const {
  auto doc = store_.load_document(prefix);
  if (!doc) return std::unexpected(doc.error());
  return write_line_items(*doc);
}

std::expected<invoscan::core::VerificationReport, ExtractionError> DocumentProcessor::verify(
    const std::string& prefix) const {
  auto fields = store_.load_fields_for_verification(prefix);
  if (!fields) return std::unexpected(fields.error());
  auto items = store_.load_line_items(prefix);
  if (!items) return std::unexpected(items.error());

  auto report = verification_engine_.verify(*fields, *items);
  if (auto saved = store_.save_report(prefix, report); !saved) {
    return std::unexpected(saved.error());
  }
  if (report.failed()) {
    invoscan::core::logger()->info("{}: verification not possible: {}", prefix, *report.error);
  } else {
    invoscan::core::logger()->info("{}: verified={} confidence={:.3f} margin={:.2f}", prefix,
                                   report.verified, report.confidence,
                                   report.error_margin.value_or(0.0));
  }
  return report;
}

DocumentOutcome DocumentProcessor::run(const std::string& prefix, Stage stage) const {
  DocumentOutcome outcome;
  outcome.prefix = prefix;
  auto fail = [&outcome](ExtractionError e) {
    outcome.error = e;
    outcome.status =
        e == ExtractionError::MissingInput ? OutcomeStatus::Skipped : OutcomeStatus::Failed;
    return outcome;
  };

  if (stage != Stage::Verify) {
    auto doc = store_.load_document(prefix);
    if (!doc) return fail(doc.error());
    if (stage == Stage::Fields || stage == Stage::All) {
      auto fields = write_fields(*doc);
      if (!fields) return fail(fields.error());
      outcome.present_fields = count_present(*fields);
    }
    if (stage == Stage::LineItems || stage == Stage::All) {
      auto items = write_line_items(*doc);
      if (!items) return fail(items.error());
      outcome.line_items = items->size();
    }
  }

  if (stage == Stage::Verify || stage == Stage::All) {
    auto report = verify(prefix);
    if (!report) return fail(report.error());
    outcome.report = std::move(*report);
  }
  return outcome;
}

std::unique_ptr<invoscan::extract::IEntityTagger> make_entity_tagger(const AppConfig& config) {
  if (config.tagger_backend == TaggerBackendType::Onnx) {
#ifdef INVOSCAN_HAS_ONNXRUNTIME
    if (config.tagger_model_path.empty() || config.tagger_vocab_path.empty() ||
        config.tagger_labels_path.empty()) {
      throw std::runtime_error(
          "tagger_backend=onnx requires tagger_model_path, tagger_vocab_path and "
          "tagger_labels_path to be set in config");
    }
    auto onnx = std::make_unique<invoscan::extract::OnnxEntityTagger>(
        config.tagger_model_path, config.tagger_vocab_path, config.tagger_labels_path,
        config.tagger_max_sequence_length);
    onnx->warmup();
    return onnx;
#else
    throw std::runtime_error(
        "ONNX tagger not available (build with -DINVOSCAN_USE_ONNXRUNTIME=ON and ONNX Runtime)");
#endif
  }
  invoscan::core::logger()->warn(
      "tagger_backend=mock: no entity model loaded, so bill_to, ship_to and their "
      "addresses will be absent");
  return std::make_unique<invoscan::extract::MockEntityTagger>();
}

DocumentProcessor make_document_processor(const AppConfig& config) {
  return DocumentProcessor(DocumentStore(config.ocr_dir, config.output_dir),
                           make_entity_tagger(config), config.line_items,
                           config.verification);
}

}  // namespace invoscan::app
