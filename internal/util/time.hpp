#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace cpandb::util {

// Milliseconds since start on the monotonic clock; used for stage timing.
uint64_t ElapsedMillis(std::chrono::steady_clock::time_point start);

// Whole days between a file's last write and now; negative if in the future.
int64_t AgeInDays(std::filesystem::file_time_type modified);

} // namespace cpandb::util
