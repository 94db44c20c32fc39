#include "time.hpp"

namespace cpandb::util {

uint64_t ElapsedMillis(std::chrono::steady_clock::time_point start) {
  const auto elapsed = std::chrono::steady_clock::now() - start;
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

int64_t AgeInDays(std::filesystem::file_time_type modified) {
  using Days = std::chrono::duration<int64_t, std::ratio<86400>>;
  return std::chrono::duration_cast<Days>(std::filesystem::file_time_type::clock::now() - modified).count();
}

} // namespace cpandb::util
