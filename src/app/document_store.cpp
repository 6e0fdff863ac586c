#include <invoscan/app/document_store.hpp>
#include <invoscan/app/json_codec.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <set>
#include <system_error>

namespace invoscan::app {

namespace {

using invoscan::core::ExtractionError;

constexpr const char* kFieldsSuffix = "_fields.json";
constexpr const char* kLineItemsSuffix = "_lineitems.json";
constexpr const char* kReportSuffix = "_verifiability_report.json";
constexpr const char* kAmountsSuffix = "_amounts.json";

std::expected<Json, ExtractionError> read_json(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(ExtractionError::MissingInput);
  }
  std::ifstream f(path);
  if (!f) return std::unexpected(ExtractionError::MissingInput);
  Json j = Json::parse(f, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return std::unexpected(ExtractionError::MalformedInput);
  return j;
}

std::expected<void, ExtractionError> write_json(const std::filesystem::path& path, const Json& j) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) return std::unexpected(ExtractionError::WriteFailed);
  std::ofstream f(path, std::ios::trunc);
  if (!f) return std::unexpected(ExtractionError::WriteFailed);
  // OCR text is not guaranteed to be valid UTF-8.
  f << j.dump(2, ' ', false, Json::error_handler_t::replace) << '\n';
  f.flush();
  if (!f) return std::unexpected(ExtractionError::WriteFailed);
  return {};
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return out;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_regular_file(ec)) out.push_back(entry.path());
  }
  return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::optional<std::pair<std::string, int>> parse_page_file_name(const std::string& file_name) {
  static const boost::regex kPagePattern(R"(^(.+)_page_([0-9]+)_raw\.json$)");
  boost::smatch m;
  if (!boost::regex_match(file_name, m, kPagePattern)) return std::nullopt;
  const std::string digits = m[2].str();
  int number = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
  return std::make_pair(m[1].str(), number);
}

std::vector<std::string> DocumentStore::discover_prefixes() const {
  std::set<std::string> prefixes;
  for (const auto& path : list_files(ocr_dir_)) {
    if (auto parsed = parse_page_file_name(path.filename().string())) {
      prefixes.insert(parsed->first);
    }
  }
  return {prefixes.begin(), prefixes.end()};
}

std::vector<std::string> DocumentStore::discover_output_prefixes() const {
  std::set<std::string> prefixes;
  const std::string suffix = kFieldsSuffix;
  for (const auto& path : list_files(output_dir_)) {
    const std::string name = path.filename().string();
    if (ends_with(name, suffix) && name.size() > suffix.size()) {
      prefixes.insert(name.substr(0, name.size() - suffix.size()));
    }
  }
  return {prefixes.begin(), prefixes.end()};
}

std::vector<PageFile> DocumentStore::page_files(const std::string& prefix) const {
  std::vector<PageFile> pages;
  for (const auto& path : list_files(ocr_dir_)) {
    auto parsed = parse_page_file_name(path.filename().string());
    if (parsed && parsed->first == prefix) {
      pages.push_back(PageFile{parsed->second, path});
    }
  }
  std::sort(pages.begin(), pages.end(), [](const PageFile& a, const PageFile& b) {
    return a.number != b.number ? a.number < b.number : a.path < b.path;
  });
  return pages;
}

std::expected<invoscan::core::Document, ExtractionError> DocumentStore::load_document(
    const std::string& prefix) const {
  const auto pages = page_files(prefix);
  if (pages.empty()) return std::unexpected(ExtractionError::MissingInput);

  invoscan::core::Document doc(prefix);
  for (const auto& page : pages) {
    auto j = read_json(page.path);
    if (!j) return std::unexpected(j.error());
    auto words = words_from_json(*j);
    if (!words) return std::unexpected(words.error());
    doc.add_page(page.number, std::move(*words));
  }
  return doc;
}

std::filesystem::path DocumentStore::fields_path(const std::string& prefix) const {
  return output_dir_ / (prefix + kFieldsSuffix);
}

std::filesystem::path DocumentStore::line_items_path(const std::string& prefix) const {
  return output_dir_ / (prefix + kLineItemsSuffix);
}

std::filesystem::path DocumentStore::report_path(const std::string& prefix) const {
  return output_dir_ / (prefix + kReportSuffix);
}

std::filesystem::path DocumentStore::amounts_path(const std::string& prefix) const {
  return output_dir_ / (prefix + kAmountsSuffix);
}

std::expected<void, ExtractionError> DocumentStore::save_fields(
    const std::string& prefix, const invoscan::core::FieldSet& fields) const {
  return write_json(fields_path(prefix), field_set_to_json(fields));
}

std::expected<void, ExtractionError> DocumentStore::save_line_items(
    const std::string& prefix, const std::vector<invoscan::core::LineItem>& items) const {
  return write_json(line_items_path(prefix), line_items_to_json(items));
}

std::expected<void, ExtractionError> DocumentStore::save_report(
    const std::string& prefix, const invoscan::core::VerificationReport& report) const {
  return write_json(report_path(prefix), report_to_json(report));
}

std::expected<invoscan::core::FieldSet, ExtractionError> DocumentStore::load_fields(
    const std::string& prefix) const {
  auto j = read_json(fields_path(prefix));
  if (!j) return std::unexpected(j.error());
  return field_set_from_json(*j);
}

std::expected<std::vector<invoscan::core::LineItem>, ExtractionError>
DocumentStore::load_line_items(const std::string& prefix) const {
  auto j = read_json(line_items_path(prefix));
  if (!j) return std::unexpected(j.error());
  return line_items_from_json(*j);
}

std::expected<invoscan::core::VerificationReport, ExtractionError> DocumentStore::load_report(
    const std::string& prefix) const {
  auto j = read_json(report_path(prefix));
  if (!j) return std::unexpected(j.error());
  return report_from_json(*j);
}

std::expected<invoscan::core::FieldSet, ExtractionError>
DocumentStore::load_fields_for_verification(const std::string& prefix) const {
  auto fields = load_fields(prefix);
  if (!fields) return fields;

  auto amounts_json = read_json(amounts_path(prefix));
  if (!amounts_json) {
    if (amounts_json.error() == ExtractionError::MissingInput) return fields;
    return std::unexpected(amounts_json.error());
  }
  auto amounts = field_set_from_json(*amounts_json);
  if (!amounts) return std::unexpected(amounts.error());
  for (auto& [name, value] : *amounts) {
    (*fields)[name] = std::move(value);
  }
  return fields;
}

}  // namespace invoscan::app
