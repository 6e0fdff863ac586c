#ifdef INVOSCAN_HAS_TBB

#include <invoscan/app/batch_runner_tbb.hpp>
#include <invoscan/app/document_processor.hpp>
#include <invoscan/app/document_store.hpp>
#include <invoscan/extract/mock_entity_tagger.hpp>
#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace na = invoscan::app;
namespace ne = invoscan::extract;
namespace nt = invoscan::test;

namespace {

na::DocumentProcessor make_processor(const std::filesystem::path& root) {
  auto tagger = std::make_unique<ne::MockEntityTagger>(std::vector<ne::TaggedSpan>{
      {"Acme Traders", ne::EntityCategory::Organization},
      {"Mumbai", ne::EntityCategory::Location},
  });
  return na::DocumentProcessor(na::DocumentStore(root / "ocr", root / "out"), std::move(tagger));
}

}  // namespace

TEST(BatchRunnerTbbTest, RunsCallbackPerPrefix) {
  nt::TempDir dir;
  std::vector<std::string> prefixes;
  for (int i = 0; i < 6; ++i) {
    const std::string prefix = "inv-" + std::to_string(i);
    nt::write_page(dir.path() / "ocr", prefix, 1, {"Invoice", "No:", prefix, "1", "Pen", "Red", "3", "10", "30"});
    prefixes.push_back(prefix);
  }
  const auto processor = make_processor(dir.path());

  std::atomic<std::size_t> call_count{0};
  std::set<std::string> seen;
  std::mutex mutex;
  const auto summary = na::run_batch_tbb(
      processor, prefixes, na::Stage::All,
      [&call_count, &seen, &mutex](const na::DocumentOutcome& o) {
        call_count++;
        std::lock_guard lock(mutex);
        seen.insert(o.prefix);
      });

  EXPECT_EQ(call_count.load(), prefixes.size());
  EXPECT_EQ(seen.size(), prefixes.size());
  EXPECT_EQ(summary.succeeded, prefixes.size());
  for (const auto& prefix : prefixes) {
    const auto fields = processor.store().load_fields(prefix);
    ASSERT_TRUE(fields.has_value()) << prefix;
    EXPECT_EQ(*fields->at("invoice_number").value, prefix);
    EXPECT_EQ(*fields->at("bill_to").value, "Acme Traders");
    EXPECT_TRUE(std::filesystem::exists(processor.store().report_path(prefix))) << prefix;
  }
}

TEST(BatchRunnerTbbTest, MissingPrefixesSkipped) {
  nt::TempDir dir;
  const auto processor = make_processor(dir.path());
  const auto summary = na::run_batch_tbb(processor, {"x", "y"}, na::Stage::Fields);
  EXPECT_EQ(summary.skipped, 2u);
  EXPECT_EQ(summary.total(), 2u);
}

TEST(BatchRunnerTbbTest, RepeatedPrefixRunsOnce) {
  nt::TempDir dir;
  nt::write_page(dir.path() / "ocr", "inv-1", 1, {"Invoice", "No:", "inv-1"});
  const auto processor = make_processor(dir.path());
  std::atomic<std::size_t> call_count{0};
  const auto summary = na::run_batch_tbb(
      processor, {"inv-1", "inv-1", "inv-1"}, na::Stage::Fields,
      [&call_count](const na::DocumentOutcome&) { call_count++; });
  EXPECT_EQ(call_count.load(), 1u);
  EXPECT_EQ(summary.succeeded, 1u);
  EXPECT_EQ(summary.total(), 1u);
}

TEST(BatchRunnerTbbTest, EmptyBatch) {
  nt::TempDir dir;
  const auto processor = make_processor(dir.path());
  EXPECT_EQ(na::run_batch_tbb(processor, {}, na::Stage::All).total(), 0u);
}

#endif  // INVOSCAN_HAS_TBB
