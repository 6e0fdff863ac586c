#include <invoscan/app/batch_runner_tbb.hpp>

#ifdef INVOSCAN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace invoscan::app {

BatchSummary run_batch_tbb(const DocumentProcessor& processor,
                           const std::vector<std::string>& prefixes,
                           Stage stage,
                           DocumentOutcomeCallback callback) {
  const std::vector<std::string> distinct = unique_prefixes(prefixes);
  if (distinct.empty()) return {};

  std::atomic<std::size_t> succeeded{0};
  std::atomic<std::size_t> skipped{0};
  std::atomic<std::size_t> failed{0};

  const std::size_t n = distinct.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          DocumentOutcome outcome = run_document(processor, distinct[i], stage);
          switch (outcome.status) {
            case OutcomeStatus::Succeeded:
              ++succeeded;
              break;
            case OutcomeStatus::Skipped:
              ++skipped;
              break;
            case OutcomeStatus::Failed:
              ++failed;
              break;
          }
          if (callback) callback(outcome);
        }
      });
  return BatchSummary{succeeded.load(), skipped.load(), failed.load()};
}

}  // namespace invoscan::app

#endif  // INVOSCAN_HAS_TBB
