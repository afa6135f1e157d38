#ifndef FX_PARSER_PROTOCOLS_FIX_TIMESTAMP_HPP
#define FX_PARSER_PROTOCOLS_FIX_TIMESTAMP_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fx/error.hpp"

namespace fx::protocols::fix {

namespace constraints {

/// @brief "YYYYMMDD-HH:MM:SS"
inline constexpr size_t kTimestampLength = 17;
/// @brief "YYYYMMDD-HH:MM:SS.sss"
inline constexpr size_t kTimestampMillisLength = 21;

}  // namespace constraints

/// @brief UTCTimestamp (UTC)
struct Timestamp {
  int year;
  unsigned month;
  unsigned day;
  unsigned hour;
  unsigned minute;
  unsigned second;
  unsigned millisecond;
  bool has_millis;  ///< 是否為毫秒格式

  [[nodiscard]] std::chrono::sys_time<std::chrono::milliseconds> to_sys_time()
      const noexcept;

  bool operator==(const Timestamp&) const = default;
};

/// @brief 依長度選擇格式後解析
/// @details 長度 17 → 無小數秒，長度 21 → 毫秒，其餘一律 MalformedDate
[[nodiscard]] Result<Timestamp> parse_timestamp(std::string_view value);

}  // namespace fx::protocols::fix

#endif
