#include "ratings_reader.hpp"

#include <charconv>
#include <fstream>

#include "internal/util/errors.hpp"

namespace cpandb::source {

namespace {

std::optional<int64_t> ParseCount(const std::string& text) {
  if (text.empty()) {
    return 0;
  }
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::vector<std::string> RatingsReader::SplitLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string              field;
  bool                     quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

RatingsFile RatingsReader::Parse(std::istream& in) {
  RatingsFile file;
  std::string line;
  bool        header = true;

  while (std::getline(in, line)) {
    if (line.empty() || line == "\r") {
      continue;
    }
    auto fields = SplitLine(line);
    if (header) {
      header = false;
      if (!fields.empty() && fields[0] == "distribution") {
        continue;
      }
    }

    if (fields.size() != 3 || fields[0].empty()) {
      ++file.skipped_lines;
      continue;
    }

    auto count = ParseCount(fields[2]);
    if (!count) {
      ++file.skipped_lines;
      continue;
    }

    RatingRecord record;
    record.distribution = std::move(fields[0]);
    if (!fields[1].empty()) {
      record.rating = std::move(fields[1]);
    }
    record.review_count = *count;
    file.ratings.push_back(std::move(record));
  }
  return file;
}

RatingsFile RatingsReader::Load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::SourceMissing("cannot open ratings file '" + path.string() + "'");
  }
  return Parse(in);
}

} // namespace cpandb::source
