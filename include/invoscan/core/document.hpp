#pragma once

#include <invoscan/core/word_record.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace invoscan::core {

/// One page of OCR output: 1-based page number and words in engine order.
struct Page {
  int number{0};
  std::vector<WordRecord> words;
};

/// All OCR pages of one source document, identified by its prefix.
/// Pages are kept in ascending page-number order; words within a page are
/// never re-sorted.
class Document {
 public:
  Document() = default;
  explicit Document(std::string prefix) : prefix_(std::move(prefix)) {}

  [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }
  [[nodiscard]] const std::vector<Page>& pages() const noexcept { return pages_; }
  [[nodiscard]] std::size_t page_count() const noexcept { return pages_.size(); }
  [[nodiscard]] bool empty() const noexcept { return pages_.empty(); }

  /// Insert a page, keeping ascending page-number order. A page with an
  /// existing number goes after the pages already stored under it.
  void add_page(int number, std::vector<WordRecord> words);

  /// Word texts of page i joined by single spaces.
  [[nodiscard]] std::string page_text(std::size_t i) const;

  /// Every page text followed by '\n', in page order.
  [[nodiscard]] std::string full_text() const;

  /// All words of all pages, concatenated in page order.
  [[nodiscard]] std::vector<WordRecord> words() const;

  [[nodiscard]] std::size_t word_count() const noexcept;

 private:
  std::string prefix_;
  std::vector<Page> pages_;
};

}  // namespace invoscan::core
