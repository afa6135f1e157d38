#include "fx/protocols/fix/scan.hpp"

#include <charconv>
#include <limits>
#include <system_error>

#include "fx/protocols/fix/error.hpp"

namespace fx::protocols::fix {

size_t find_next_of(std::string_view buffer, size_t pos, char c) noexcept {
  if (pos >= buffer.size()) {
    return buffer.size();
  }
  size_t found = buffer.find(c, pos);
  return found == std::string_view::npos ? buffer.size() : found;
}

Result<UintField> parse_uint(std::string_view buffer, size_t pos,
                             char terminator) {
  constexpr uint64_t kMax = std::numeric_limits<uint32_t>::max();

  uint64_t value = 0;
  size_t i = pos;
  for (; i < buffer.size() && buffer[i] != terminator; ++i) {
    if (!is_digit(buffer[i])) [[unlikely]] {
      return fail_at(FixErrc::MalformedInteger, i);
    }
    value = value * 10 + static_cast<uint64_t>(buffer[i] - '0');
    if (value > kMax) [[unlikely]] {
      return fail_at(FixErrc::MalformedInteger, i);
    }
  }

  // 沒有數字或沒有遇到 terminator
  if (i == pos || i >= buffer.size()) [[unlikely]] {
    return fail_at(FixErrc::MalformedInteger, i);
  }

  return UintField{static_cast<uint32_t>(value), i};
}

Result<int64_t> parse_int(std::string_view value) {
  const char* last = value.data() + value.size();

  // from_chars 不接受 '+' 與空白，剛好符合 FIX int 格式
  int64_t result = 0;
  auto [ptr, ec] = std::from_chars(value.data(), last, result);
  if (ec != std::errc{} || ptr != last) {
    return fail(FixErrc::MalformedInteger);
  }

  return result;
}

bool is_decimal(std::string_view value) noexcept {
  size_t i = 0;
  if (i < value.size() && value[i] == '-') {
    ++i;
  }

  size_t digits = 0;
  bool seen_point = false;
  for (; i < value.size(); ++i) {
    if (is_digit(value[i])) {
      ++digits;
    } else if (value[i] == '.' && !seen_point) {
      seen_point = true;
    } else {
      return false;
    }
  }
  return digits > 0;
}

}  // namespace fx::protocols::fix
