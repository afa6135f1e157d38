#ifndef FX_PARSER_TEXT_ENCODING_HPP
#define FX_PARSER_TEXT_ENCODING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "fx/error.hpp"

namespace fx::text {

/// @brief 字串欄位的來源編碼
enum class Encoding : uint8_t {
  Ascii,   ///< US-ASCII，拒絕 >= 0x80
  Latin1,  ///< ISO-8859-1，逐 byte 轉為 UTF-8
  Utf8,    ///< UTF-8，只驗證格式
};

[[nodiscard]] std::string_view to_string(Encoding encoding) noexcept;

/// @brief 由 MessageEncoding (Tag 347) 的名稱取得編碼
/// @return 不支援的名稱回傳 nullopt
[[nodiscard]] std::optional<Encoding> encoding_from_name(
    std::string_view name) noexcept;

/// @brief 解碼為 UTF-8 字串
/// @details 失敗時回傳 InvalidEncoding，offset 為第一個不合法的 byte
[[nodiscard]] Result<std::string> decode(std::string_view bytes,
                                         Encoding encoding);

}  // namespace fx::text

#endif
