#pragma once

#include <invoscan/app/batch_runner.hpp>
#include <invoscan/app/document_processor.hpp>
#include <string>
#include <vector>

#ifdef INVOSCAN_HAS_TBB

namespace invoscan::app {

/// Runs the stage for a batch of prefixes in parallel using TBB.
///
/// Each distinct prefix is one task; repeats are dropped first, so tasks own
/// disjoint files and need no locking. Each task runs with the same failure
/// isolation as run_document().
///
/// \param processor Shared by all tasks; its tagger must be safe to call concurrently.
/// \param prefixes Documents to process; repeats run once.
/// \param callback Invoked for each outcome. Must be thread-safe.
BatchSummary run_batch_tbb(const DocumentProcessor& processor,
                           const std::vector<std::string>& prefixes,
                           Stage stage,
                           DocumentOutcomeCallback callback = nullptr);

}  // namespace invoscan::app

#endif  // INVOSCAN_HAS_TBB
