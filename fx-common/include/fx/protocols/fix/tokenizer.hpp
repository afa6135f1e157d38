#ifndef FX_PARSER_PROTOCOLS_FIX_TOKENIZER_HPP
#define FX_PARSER_PROTOCOLS_FIX_TOKENIZER_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "fx/error.hpp"
#include "fx/protocols/fix/field.hpp"
#include "fx/protocols/fix/tag_registry.hpp"

namespace fx::protocols::fix {

/// @brief 欄位切分策略
/// @details 兩者對合法訊息輸出完全相同，TwoPass 保留作為 benchmark 與測試基準
enum class TokenizerStrategy : uint8_t {
  OnePass,  ///< 單次掃描的狀態機
  TwoPass,  ///< 驗證後逐欄位以 find() 定位 '=' 與 SOH
};

[[nodiscard]] std::string_view to_string(TokenizerStrategy strategy) noexcept;

/// @brief 切分 [body_start, trailer_start) 之間的欄位
/// @param buffer 完整訊息
/// @param body_start Body 起點（"35=" 的位置）
/// @param trailer_start Trailer 起點（"10=" 的位置）
/// @param registry 用於判斷 DataLength / Data 欄位
/// @param out 追加輸出的欄位
/// @return 失敗時 out 只包含部分欄位，整體應視為解析失敗
/// @details
///   - DataLength 欄位的值決定「下一個」欄位的原始資料長度
///   - Data 欄位直接跳過宣告長度，內容中的 SOH 與 '=' 不視為分隔
[[nodiscard]] Result<void> tokenize(
    std::string_view buffer, size_t body_start, size_t trailer_start,
    const TagRegistry& registry, std::vector<FieldDescriptor>& out,
    TokenizerStrategy strategy = TokenizerStrategy::OnePass);

}  // namespace fx::protocols::fix

#endif
