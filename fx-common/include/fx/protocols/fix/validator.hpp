#ifndef FX_PARSER_PROTOCOLS_FIX_VALIDATOR_HPP
#define FX_PARSER_PROTOCOLS_FIX_VALIDATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fx/error.hpp"

namespace fx::protocols::fix {

/// @brief 結構驗證後的關鍵位置
/// @details
///   8=FIX.4.4|9=289|35=8|...|10=163|
///            ^     ^          ^
///            │     │          └ trailer_start
///            │     └ body_start
///            └ begin_string_end + 1
struct ValidationInfo {
  std::string_view begin_string;  ///< Tag 8 的值
  size_t begin_string_end;        ///< Tag 8 之後的 SOH 位置
  size_t body_start;              ///< Tag 9 之後的第一個 byte（"35=" 開頭）
  size_t trailer_start;           ///< "10=" 的位置
  uint32_t declared_body_length;  ///< Tag 9 的值
  std::string_view msg_type;      ///< Tag 35 的值
  uint8_t checksum;               ///< Tag 10 的值
};

/// @brief 計算 checksum
/// @details 所有 byte 以無號數相加後 mod 256，避免 signed char 造成負值
[[nodiscard]] uint8_t compute_checksum(std::string_view bytes) noexcept;

/// @brief 驗證訊息結構
/// @details 依序檢查，任一步失敗即返回：
///   1. "8=" 開頭
///   2. 下一個欄位為 "9="，值為以 SOH 結尾的非負整數
///   3. 下一個欄位為 "35="，值不可為空
///   4. 最後 7 bytes 為 "10=" + 3 位數字 + SOH
///   5. BodyLength == trailer_start - body_start
///   6. Checksum 相符
[[nodiscard]] Result<ValidationInfo> validate(std::string_view buffer);

}  // namespace fx::protocols::fix

#endif
