#pragma once

#include <chrono>
#include <cstdint>

namespace context_mcp::core {

inline std::int64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

constexpr std::int64_t hours_to_ms(const std::int64_t hours) { return hours * 60 * 60 * 1000; }

constexpr std::int64_t minutes_to_ms(const std::int64_t minutes) { return minutes * 60 * 1000; }

constexpr std::int64_t days_to_ms(const std::int64_t days) { return hours_to_ms(days * 24); }

}  // namespace context_mcp::core
