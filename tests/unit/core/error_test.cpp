#include <invoscan/core/error.hpp>
#include <gtest/gtest.h>
#include <iterator>
#include <set>
#include <string>

namespace nc = invoscan::core;

TEST(ExtractionError, EveryCodeHasItsOwnName) {
  const nc::ExtractionError codes[] = {
      nc::ExtractionError::None,
      nc::ExtractionError::MissingInput,
      nc::ExtractionError::MalformedInput,
      nc::ExtractionError::WriteFailed,
      nc::ExtractionError::TaggerFailed,
  };
  std::set<std::string> names;
  for (auto code : codes) {
    const std::string name = nc::to_string(code);
    EXPECT_NE(name, "Unknown");
    names.insert(name);
  }
  EXPECT_EQ(names.size(), std::size(codes));
  EXPECT_STREQ(nc::to_string(nc::ExtractionError::TaggerFailed), "TaggerFailed");
}
