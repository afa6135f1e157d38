#ifndef FX_PARSER_PROTOCOLS_FIX_SCAN_HPP
#define FX_PARSER_PROTOCOLS_FIX_SCAN_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fx/error.hpp"
#include "fx/protocols/fix/field.hpp"

namespace fx::protocols::fix {

/// @brief 解析出的無號整數與其結束位置
struct UintField {
  uint32_t value;
  size_t end;  ///< 終止字元的位置
};

[[nodiscard]] constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

/// @brief 找出 pos 之後第一個 c 的位置
/// @return 位置，找不到時回傳 buffer.size()
[[nodiscard]] size_t find_next_of(std::string_view buffer, size_t pos,
                                  char c) noexcept;

/// @brief 從 pos 開始解析十進位無號整數，直到 terminator
/// @details 至少一位數字、不可溢位 uint32_t、必須遇到 terminator
[[nodiscard]] Result<UintField> parse_uint(std::string_view buffer, size_t pos,
                                           char terminator = SOH);

/// @brief 解析整個 value 為有號整數（可選的前導 '-'）
[[nodiscard]] Result<int64_t> parse_int(std::string_view value);

/// @brief 是否為 FIX 十進位格式：可選的 '-'、數字、可選的 '.' 與數字
/// @note 至少一位數字；不接受 '+'、指數、nan、inf
[[nodiscard]] bool is_decimal(std::string_view value) noexcept;

}  // namespace fx::protocols::fix

#endif
