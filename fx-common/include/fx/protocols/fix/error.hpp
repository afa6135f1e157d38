#ifndef FX_PARSER_PROTOCOLS_FIX_ERROR_HPP
#define FX_PARSER_PROTOCOLS_FIX_ERROR_HPP

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

namespace fx::protocols::fix {

enum class FixErrc : uint8_t {
  // 結構驗證
  HeaderTagMismatch = 1,  ///< 開頭不是 "8="
  LengthTagMismatch,      ///< 第二個欄位不是 "9="
  MsgTypeTagMismatch,     ///< 第三個欄位不是 "35="
  TrailerTagMismatch,     ///< 結尾不是 "10=ccc<SOH>"
  LengthMismatch,         ///< BodyLength 與實際不符
  ChecksumMismatch,       ///< Checksum 不正確
  // 欄位切分
  MalformedTagNumber,     ///< Tag 含非數字字元
  MalformedInteger,       ///< 整數值格式錯誤
  DataLengthOverflow,     ///< Data 長度超過 Trailer 邊界
  MissingDataTerminator,  ///< Data 之後不是 SOH
  UnterminatedField,      ///< 欄位未結束就碰到 Trailer
  // 型別存取
  TagNotFound,      ///< 訊息中沒有此 Tag
  TypeMismatch,     ///< Tag 宣告型別與存取方式不符
  MalformedDate,    ///< 時間格式錯誤
  InvalidEncoding,  ///< 字串不符合指定編碼
  // 訊息構造
  BodyLengthExceeded  ///< 超過 Body 上限
};

class FixCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "fx.protocols.fix"; }

  std::string message(int ec) const override;
};

const std::error_category& category() noexcept;

std::error_code make_error_code(FixErrc ec) noexcept;

}  // namespace fx::protocols::fix

template <>
struct std::is_error_code_enum<fx::protocols::fix::FixErrc> : std::true_type {};

#endif
