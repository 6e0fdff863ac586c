/**
 * invoscan-cli: extract header fields and line items from OCR word files and verify totals.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/invoscan-cli/invoscan_cli [--config path] [--stage all] [--prefix P ...]
 * Reads <ocr_dir>/<prefix>_page_<n>_raw.json; writes <output_dir>/<prefix>_{fields,lineitems,verifiability_report}.json.
 */

#include <invoscan/app/batch_runner.hpp>
#include <invoscan/app/config.hpp>
#include <invoscan/app/document_processor.hpp>
#ifdef INVOSCAN_HAS_TBB
#include <invoscan/app/batch_runner_tbb.hpp>
#endif
#include <invoscan/core/error.hpp>
#include <invoscan/core/logging.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: invoscan_cli [options]\n"
            << "  --config <path>      Config (key=value file); default: built-in\n"
            << "  --ocr-dir <dir>      Directory of <prefix>_page_<n>_raw.json files\n"
            << "  --output-dir <dir>   Directory for fields / line items / reports\n"
            << "  --stage <name>       fields | lineitems | verify | all (default all)\n"
            << "  --prefix <p>         Document prefix; repeatable (default: all discovered)\n"
            << "  --workers <n>        Parallel documents; 1 = sequential, 0 = hardware (default from config)\n"
            << "  --tbb                Use the TBB runner instead of the thread pool\n"
            << "  --backend <type>     Entity tagger: mock | onnx (default from config)\n"
            << "  --model <path>       Tagger model (.onnx)\n"
            << "  --vocab <path>       Tagger vocabulary file\n"
            << "  --labels <path>      Tagger label file\n"
            << "  --log-level <lvl>    trace | debug | info | warn | error | off\n";
}

std::string format_outcome(const invoscan::app::DocumentOutcome& o) {
  std::ostringstream out;
  out << o.prefix << ": ";
  switch (o.status) {
    case invoscan::app::OutcomeStatus::Skipped:
      out << "skipped (" << invoscan::core::to_string(o.error) << ")";
      return out.str();
    case invoscan::app::OutcomeStatus::Failed:
      out << "failed (" << (o.message.empty() ? invoscan::core::to_string(o.error) : o.message)
          << ")";
      return out.str();
    case invoscan::app::OutcomeStatus::Succeeded:
      break;
  }
  out << "fields_present=" << o.present_fields << " line_items=" << o.line_items;
  if (o.report) {
    if (o.report->failed()) {
      out << " verified=false error=\"" << *o.report->error << "\"";
    } else {
      out << " verified=" << (o.report->verified ? "true" : "false")
          << " confidence=" << o.report->confidence
          << " error_margin=" << o.report->error_margin.value_or(0.0);
    }
  }
  return out.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string ocr_dir_override;
  std::string output_dir_override;
  std::string stage_name = "all";
  std::vector<std::string> prefixes;
  std::string workers_override;
  bool use_tbb = false;
  std::string backend_override;
  std::string model_override;
  std::string vocab_override;
  std::string labels_override;
  std::string log_level_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--ocr-dir" && i + 1 < argc) {
      ocr_dir_override = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir_override = argv[++i];
    } else if (arg == "--stage" && i + 1 < argc) {
      stage_name = argv[++i];
    } else if (arg == "--prefix" && i + 1 < argc) {
      prefixes.emplace_back(argv[++i]);
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--tbb") {
      use_tbb = true;
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--vocab" && i + 1 < argc) {
      vocab_override = argv[++i];
    } else if (arg == "--labels" && i + 1 < argc) {
      labels_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << " (see --help)\n";
      return 1;
    }
  }

  invoscan::app::AppConfig cfg;
  try {
    cfg = config_path.empty() ? invoscan::app::default_config()
                              : invoscan::app::load_config(config_path);
    if (!workers_override.empty()) cfg.num_workers = std::stoul(workers_override);
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return 1;
  }
  if (!ocr_dir_override.empty()) cfg.ocr_dir = ocr_dir_override;
  if (!output_dir_override.empty()) cfg.output_dir = output_dir_override;
  if (!model_override.empty()) cfg.tagger_model_path = model_override;
  if (!vocab_override.empty()) cfg.tagger_vocab_path = vocab_override;
  if (!labels_override.empty()) cfg.tagger_labels_path = labels_override;
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (!backend_override.empty() &&
      !invoscan::app::parse_tagger_backend(backend_override, cfg.tagger_backend)) {
    std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
    return 1;
  }

  invoscan::app::Stage stage{};
  if (!invoscan::app::parse_stage(stage_name, stage)) {
    std::cerr << "Unknown --stage " << stage_name << " (use fields, lineitems, verify or all)\n";
    return 1;
  }
  if (!invoscan::core::set_log_level(cfg.log_level)) {
    std::cerr << "Unknown log level " << cfg.log_level << "\n";
    return 1;
  }

  std::unique_ptr<invoscan::app::DocumentProcessor> processor;
  try {
    processor = std::make_unique<invoscan::app::DocumentProcessor>(
        invoscan::app::make_document_processor(cfg));
  } catch (const std::exception& e) {
    std::cerr << "Failed to set up entity tagger: " << e.what() << "\n";
    return 1;
  }

  prefixes = invoscan::app::unique_prefixes(prefixes);
  if (prefixes.empty()) {
    prefixes = stage == invoscan::app::Stage::Verify
                   ? processor->store().discover_output_prefixes()
                   : processor->store().discover_prefixes();
  }
  if (prefixes.empty()) {
    std::cerr << "No documents found in "
              << (stage == invoscan::app::Stage::Verify ? cfg.output_dir : cfg.ocr_dir) << "\n";
    return 1;
  }

  std::mutex out_mutex;
  auto print = [&out_mutex](const invoscan::app::DocumentOutcome& o) {
    const std::string line = format_outcome(o);
    std::lock_guard lock(out_mutex);
    std::cout << line << "\n";
  };

  invoscan::app::BatchSummary summary;
  if (use_tbb) {
#ifdef INVOSCAN_HAS_TBB
    summary = invoscan::app::run_batch_tbb(*processor, prefixes, stage, print);
#else
    std::cerr << "TBB runner not available (build with -DINVOSCAN_USE_TBB=ON and oneTBB)\n";
    return 1;
#endif
  } else if (cfg.num_workers == 1) {
    summary = invoscan::app::run_batch(*processor, prefixes, stage, print);
  } else {
    summary = invoscan::app::run_batch_parallel(*processor, prefixes, stage, print,
                                                cfg.num_workers);
  }

  std::cout << "documents=" << summary.total() << " succeeded=" << summary.succeeded
            << " skipped=" << summary.skipped << " failed=" << summary.failed << "\n";
  return 0;
}
