#include "source_age.hpp"

#include <system_error>

#include "internal/util/time.hpp"

namespace cpandb::source {

std::optional<int64_t> FileModifiedAge::AgeDays(const std::filesystem::path& path) const {
  std::error_code ec;
  const auto modified = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return util::AgeInDays(modified);
}

} // namespace cpandb::source
