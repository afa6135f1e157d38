#include "fx/protocols/fix/timestamp.hpp"

#include "fx/protocols/fix/error.hpp"
#include "fx/protocols/fix/scan.hpp"

namespace fx::protocols::fix {

namespace {

/// @brief 讀取固定位數的十進位數字
/// @return 失敗時回傳 -1
[[nodiscard]] int read_digits(std::string_view value, size_t pos,
                              size_t count) noexcept {
  int result = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!is_digit(value[i])) {
      return -1;
    }
    result = result * 10 + (value[i] - '0');
  }
  return result;
}

}  // namespace

std::chrono::sys_time<std::chrono::milliseconds> Timestamp::to_sys_time()
    const noexcept {
  using namespace std::chrono;
  sys_days date = year_month_day{std::chrono::year{year},
                                 std::chrono::month{month},
                                 std::chrono::day{day}};
  return time_point_cast<milliseconds>(date) + hours{hour} +
         minutes{minute} + seconds{second} + milliseconds{millisecond};
}

Result<Timestamp> parse_timestamp(std::string_view value) {
  // 純粹以長度決定格式
  bool has_millis = false;
  if (value.size() == constraints::kTimestampMillisLength) {
    has_millis = true;
  } else if (value.size() != constraints::kTimestampLength) {
    return fail_mismatch(
        FixErrc::MalformedDate,
        static_cast<int64_t>(constraints::kTimestampLength),
        static_cast<int64_t>(value.size()));
  }

  // YYYYMMDD-HH:MM:SS[.sss]
  // 0   4 6 8 9  12 15 17
  if (value[8] != '-' || value[11] != ':' || value[14] != ':' ||
      (has_millis && value[17] != '.')) {
    return fail(FixErrc::MalformedDate);
  }

  int year = read_digits(value, 0, 4);
  int month = read_digits(value, 4, 2);
  int day = read_digits(value, 6, 2);
  int hour = read_digits(value, 9, 2);
  int minute = read_digits(value, 12, 2);
  int second = read_digits(value, 15, 2);
  int millis = has_millis ? read_digits(value, 18, 3) : 0;

  if (year < 0 || month < 0 || day < 0 || hour < 0 || minute < 0 ||
      second < 0 || millis < 0) {
    return fail(FixErrc::MalformedDate);
  }

  std::chrono::year_month_day ymd{std::chrono::year{year},
                                  std::chrono::month{static_cast<unsigned>(month)},
                                  std::chrono::day{static_cast<unsigned>(day)}};
  // 秒數允許 60（閏秒）
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
    return fail(FixErrc::MalformedDate);
  }

  return Timestamp{.year = year,
                   .month = static_cast<unsigned>(month),
                   .day = static_cast<unsigned>(day),
                   .hour = static_cast<unsigned>(hour),
                   .minute = static_cast<unsigned>(minute),
                   .second = static_cast<unsigned>(second),
                   .millisecond = static_cast<unsigned>(millis),
                   .has_millis = has_millis};
}

}  // namespace fx::protocols::fix
