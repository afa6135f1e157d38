#ifndef FX_PARSER_PROTOCOLS_FIX_MESSAGE_BUILDER_HPP
#define FX_PARSER_PROTOCOLS_FIX_MESSAGE_BUILDER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "fx/error.hpp"
#include "fx/protocols/fix/field.hpp"

namespace fx::protocols::fix {

namespace constraints {

inline constexpr size_t kBodyLengthMaxDigits = 5;  // "99999" = 5
inline constexpr size_t kBodyLengthFieldReserve =
    2 + kBodyLengthMaxDigits + 1;  // "9=" + 5 digits + SOH = 8

}  // namespace constraints

/// @brief FIX 訊息構造器
/// @details 依加入順序輸出欄位，自動補上 Tag 9 與 Tag 10
class MessageBuilder {
 private:
  struct Field {
    int tag;
    std::string value;
  };

  std::string begin_string_ = "FIX.4.4";
  std::string msg_type_;
  std::vector<Field> fields_;

 public:
  // ============================
  // 建構函數
  // ============================

  explicit MessageBuilder(std::string_view msg_type) : msg_type_(msg_type) {
    fields_.reserve(constraints::kDefaultFieldCapacity);
  }

  // ============================
  // Header 欄位
  // ============================

  /// @brief 設定協定版本（Tag 8）
  MessageBuilder& set_begin_string(std::string_view begin_string) {
    begin_string_ = begin_string;
    return *this;
  }

  // ============================
  // Body 欄位
  // ============================

  /// @brief 新增字串型欄位
  MessageBuilder& add_field(int tag, std::string_view value) {
    fields_.push_back({tag, std::string(value)});
    return *this;
  }

  MessageBuilder& add_field(int tag, const char* value) {
    return add_field(tag, std::string_view(value));
  }

  /// @brief 新增整數型欄位
  MessageBuilder& add_field(int tag, int64_t value);

  MessageBuilder& add_field(int tag, int value) {
    return add_field(tag, static_cast<int64_t>(value));
  }

  /// @brief 新增浮點數型欄位
  MessageBuilder& add_field(int tag, double value, int precision = 2);

  /// @brief 新增一組長度 + 資料欄位
  /// @details 長度欄位的值由 payload 大小決定，payload 可含 SOH
  MessageBuilder& add_data_field(int length_tag, int data_tag,
                                 std::string_view payload);

  // ============================
  // 構造訊息
  // ============================

  /// @brief 建構完整 FIX 訊息
  /// @return 成功返回 FIX 協定字串，失敗返回錯誤
  /// @details
  ///   - MsgType 為空：MsgTypeTagMismatch
  ///   - Body 超過 kMaxBodyLength：BodyLengthExceeded
  [[nodiscard]] Result<std::string> build() const;

 private:
  static void append_field(std::string& str, int tag, std::string_view value);

  /// @brief 追加 checksum tag
  /// @details 獨立於 append_field 是因爲 FIX 格式規定要補齊到三位
  static void append_checksum(std::string& str, unsigned checksum);

  /// @brief 估算最終訊息大小
  /// @details 用於 std::string::reserve() 減少記憶體重分配
  [[nodiscard]] size_t estimate_size() const noexcept;
};

}  // namespace fx::protocols::fix

#endif
