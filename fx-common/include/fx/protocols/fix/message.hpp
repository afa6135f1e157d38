#ifndef FX_PARSER_PROTOCOLS_FIX_MESSAGE_HPP
#define FX_PARSER_PROTOCOLS_FIX_MESSAGE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "fx/error.hpp"
#include "fx/protocols/fix/field.hpp"
#include "fx/protocols/fix/tag_registry.hpp"
#include "fx/protocols/fix/timestamp.hpp"
#include "fx/protocols/fix/tokenizer.hpp"
#include "fx/protocols/fix/validator.hpp"
#include "fx/text/encoding.hpp"

namespace fx::protocols::fix {

namespace constraints {

/// @brief 非 Encoded 字串欄位的編碼
inline constexpr text::Encoding kDefaultEncoding = text::Encoding::Ascii;

}  // namespace constraints

struct ParseOptions {
  TokenizerStrategy strategy = TokenizerStrategy::OnePass;
  text::Encoding encoding = text::Encoding::Utf8;  ///< Encoded 欄位的編碼
  const TagRegistry* registry = &TagRegistry::standard();
};

/// @brief 解析後的 FIX 訊息
///
/// 生命週期：
/// - 建構時只持有 buffer（之後視為不可變）
/// - parse() 填入欄位；重複呼叫會清空後重新填入
/// - parse() 完成後唯讀，可由多個執行緒同時讀取
///
/// @note
/// - 欄位只記錄 offset，不複製內容
/// - 同一個 Tag 出現多次時，find_field() 回傳最後一個
///
class Message {
 private:
  std::string buffer_;
  ParseOptions options_;
  std::vector<FieldDescriptor> fields_;
  std::unordered_map<int, size_t> index_;  ///< tag → fields_ 的位置
  std::string msg_type_;
  std::optional<ValidationInfo> info_;  ///< 只有 offset 有效，view 已清空

 public:
  explicit Message(std::string buffer, ParseOptions options = {});

  // ----------------------------------------------------------------------------
  // Parse
  // ----------------------------------------------------------------------------

  /// @brief 驗證並切分整個訊息
  /// @details
  ///   - 結構驗證失敗：不產生任何欄位
  ///   - 切分失敗：fields() 只有部分欄位，整體視為失敗
  Result<void> parse();

  [[nodiscard]] bool is_parsed() const noexcept { return info_.has_value(); }

  // ----------------------------------------------------------------------------
  // Access
  // ----------------------------------------------------------------------------

  [[nodiscard]] std::string_view raw() const noexcept { return buffer_; }

  [[nodiscard]] const ParseOptions& options() const noexcept {
    return options_;
  }

  /// @brief 依線上順序排列的所有欄位（包含 8, 9, 10）
  [[nodiscard]] std::span<const FieldDescriptor> fields() const noexcept {
    return fields_;
  }

  [[nodiscard]] const FieldDescriptor* find_field(int tag) const noexcept;

  [[nodiscard]] std::string_view value(
      const FieldDescriptor& field) const noexcept {
    return std::string_view(buffer_).substr(field.value_start,
                                            field.value_size());
  }

  [[nodiscard]] std::string_view msg_type() const noexcept {
    return msg_type_;
  }

  [[nodiscard]] std::string_view begin_string() const noexcept;

  [[nodiscard]] std::optional<uint32_t> body_length() const noexcept;

  // ----------------------------------------------------------------------------
  // Typed accessors
  // ----------------------------------------------------------------------------

  /// @brief 複製原始 bytes（Data 欄位適用）
  [[nodiscard]] Result<std::vector<std::byte>> raw_bytes(int tag) const;

  /// @brief 型別須為 Int
  [[nodiscard]] Result<int64_t> as_int(int tag) const;

  /// @brief 型別須為 Int 或 Float
  /// @note 價格類 Tag 在表中登記為 Int，因此 Int 也允許
  [[nodiscard]] Result<double> as_float(int tag) const;

  /// @brief 型別須為 String；Encoded 欄位以 options().encoding 解碼
  [[nodiscard]] Result<std::string> as_string(int tag) const;

  /// @brief 型別須為 Date
  [[nodiscard]] Result<Timestamp> as_date(int tag) const;

 private:
  void reset() noexcept;

  [[nodiscard]] Result<const FieldDescriptor*> require(
      int tag, SemanticType type) const;
};

}  // namespace fx::protocols::fix

#endif
