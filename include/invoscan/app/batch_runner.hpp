#pragma once

#include <invoscan/app/document_processor.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace invoscan::app {

/// Callback for each DocumentOutcome; may be invoked from worker threads.
/// Must be thread-safe if using run_batch_parallel or run_batch_tbb.
using DocumentOutcomeCallback = std::function<void(const DocumentOutcome&)>;

/// Counts over one batch.
struct BatchSummary {
  std::size_t succeeded{0};
  std::size_t skipped{0};
  std::size_t failed{0};

  [[nodiscard]] std::size_t total() const noexcept { return succeeded + skipped + failed; }
};

/// prefixes with repeats removed, first occurrence kept, order preserved.
[[nodiscard]] std::vector<std::string> unique_prefixes(const std::vector<std::string>& prefixes);

/// Runs one document with failure isolation: an exception from any stage is
/// logged and reported as a Failed outcome instead of propagating.
[[nodiscard]] DocumentOutcome run_document(const DocumentProcessor& processor,
                                           const std::string& prefix,
                                           Stage stage);

/// Runs the stage for every prefix sequentially; calls callback for each outcome.
/// One document's failure never stops the batch.
BatchSummary run_batch(const DocumentProcessor& processor,
                       const std::vector<std::string>& prefixes,
                       Stage stage,
                       DocumentOutcomeCallback callback = nullptr);

/// Runs the stage for every prefix in parallel on a thread pool, one task per
/// distinct prefix; repeated prefixes run once. callback may be invoked from any
/// worker (must be thread-safe). num_workers 0 = use hardware concurrency.
BatchSummary run_batch_parallel(const DocumentProcessor& processor,
                                const std::vector<std::string>& prefixes,
                                Stage stage,
                                DocumentOutcomeCallback callback = nullptr,
                                std::size_t num_workers = 0);

}  // namespace invoscan::app
