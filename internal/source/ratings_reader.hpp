#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace cpandb::source {

struct RatingRecord {
  std::string                distribution;
  std::optional<std::string> rating;
  int64_t                    review_count = 0;
};

struct RatingsFile {
  std::vector<RatingRecord> ratings;
  uint64_t                  skipped_lines = 0;
};

/*
  Reader for the community ratings CSV:

    "distribution","rating","review_count"
    "Foo-Bar","4.5","12"

  Fields may be quoted; "" inside quotes is a literal quote. Lines that do
  not have three fields or whose count is not a number are skipped and
  counted, never fatal.
*/
class RatingsReader {
 public:
  static RatingsFile Load(const std::filesystem::path& path);
  static RatingsFile Parse(std::istream& in);

  // Splits one CSV line; exposed for tests.
  static std::vector<std::string> SplitLine(const std::string& line);
};

} // namespace cpandb::source
