#include <invoscan/core/document.hpp>
#include <algorithm>

namespace invoscan::core {

void Document::add_page(int number, std::vector<WordRecord> words) {
  const auto pos = std::upper_bound(
      pages_.begin(), pages_.end(), number,
      [](int n, const Page& p) { return n < p.number; });
  pages_.insert(pos, Page{number, std::move(words)});
}

std::string Document::page_text(std::size_t i) const {
  std::string out;
  if (i >= pages_.size()) return out;
  const auto& words = pages_[i].words;
  for (std::size_t w = 0; w < words.size(); ++w) {
    if (w > 0) out.push_back(' ');
    out += words[w].text;
  }
  return out;
}

std::string Document::full_text() const {
  std::string out;
  for (std::size_t i = 0; i < pages_.size(); ++i) {
    out += page_text(i);
    out.push_back('\n');
  }
  return out;
}

std::vector<WordRecord> Document::words() const {
  std::vector<WordRecord> out;
  out.reserve(word_count());
  for (const auto& page : pages_) {
    out.insert(out.end(), page.words.begin(), page.words.end());
  }
  return out;
}

std::size_t Document::word_count() const noexcept {
  std::size_t n = 0;
  for (const auto& page : pages_) n += page.words.size();
  return n;
}

}  // namespace invoscan::core
