#include <invoscan/app/batch_runner.hpp>
#include <invoscan/core/logging.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

namespace invoscan::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

struct AtomicSummary {
  std::atomic<std::size_t> succeeded{0};
  std::atomic<std::size_t> skipped{0};
  std::atomic<std::size_t> failed{0};

  void add(const DocumentOutcome& o) {
    switch (o.status) {
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
  }

  BatchSummary get() const { return BatchSummary{succeeded.load(), skipped.load(), failed.load()}; }
};

}  // namespace

std::vector<std::string> unique_prefixes(const std::vector<std::string>& prefixes) {
  std::vector<std::string> out;
  out.reserve(prefixes.size());
  std::unordered_set<std::string> seen;
  for (const auto& prefix : prefixes) {
    if (seen.insert(prefix).second) out.push_back(prefix);
  }
  if (out.size() != prefixes.size()) {
    invoscan::core::logger()->warn("{} repeated prefix(es) dropped from the batch",
                                   prefixes.size() - out.size());
  }
  return out;
}

DocumentOutcome run_document(const DocumentProcessor& processor,
                             const std::string& prefix,
                             Stage stage) {
  DocumentOutcome outcome;
  try {
    outcome = processor.run(prefix, stage);
  } catch (const std::exception& e) {
    outcome = DocumentOutcome{};
    outcome.prefix = prefix;
    outcome.status = OutcomeStatus::Failed;
    outcome.message = e.what();
    invoscan::core::logger()->error("{}: {} stage aborted: {}", prefix, to_string(stage), e.what());
    return outcome;
  }

  if (outcome.status == OutcomeStatus::Skipped) {
    invoscan::core::logger()->warn("{}: required input not found ({}); skipped", prefix,
                                   invoscan::core::to_string(outcome.error));
  } else if (outcome.status == OutcomeStatus::Failed) {
    invoscan::core::logger()->error("{}: {} stage failed ({})", prefix, to_string(stage),
                                    invoscan::core::to_string(outcome.error));
  }
  return outcome;
}

BatchSummary run_batch(const DocumentProcessor& processor,
                       const std::vector<std::string>& prefixes,
                       Stage stage,
                       DocumentOutcomeCallback callback) {
  AtomicSummary summary;
  for (const auto& prefix : prefixes) {
    DocumentOutcome outcome = run_document(processor, prefix, stage);
    summary.add(outcome);
    if (callback) callback(outcome);
  }
  return summary.get();
}

BatchSummary run_batch_parallel(const DocumentProcessor& processor,
                                const std::vector<std::string>& prefixes,
                                Stage stage,
                                DocumentOutcomeCallback callback,
                                std::size_t num_workers) {
  const std::vector<std::string> distinct = unique_prefixes(prefixes);
  const std::size_t n = distinct.size();
  if (n == 0) return {};

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return run_batch(processor, distinct, stage, std::move(callback));
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;
  AtomicSummary summary;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      DocumentOutcome outcome = run_document(processor, distinct[idx], stage);
      summary.add(outcome);
      if (callback) callback(outcome);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return summary.get();
}

}  // namespace invoscan::app
