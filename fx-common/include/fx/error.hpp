#ifndef FX_PARSER_ERROR_HPP
#define FX_PARSER_ERROR_HPP

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <system_error>
#include <type_traits>

namespace fx {

/// @brief 解析錯誤，封裝錯誤碼與診斷資訊
/// @details
///   - code: 錯誤類別（e.g. fx.protocols.fix）
///   - expected / actual: 宣告值與實際計算值（LengthMismatch, ChecksumMismatch）
///   - offset: 錯誤發生的 byte 位置
///   - tag: 相關的 Tag 號碼（TagNotFound, TypeMismatch）
///   - location: 錯誤源頭的原始碼位置
///
/// 目的是讓呼叫端不需重新掃描 buffer 就能診斷錯誤的輸入。
class Error {
 private:
  std::error_code code_;
  std::optional<int64_t> expected_;
  std::optional<int64_t> actual_;
  std::optional<size_t> offset_;
  std::optional<int> tag_;
  std::source_location location_;

 public:
  explicit Error(std::error_code code,
                 std::source_location loc = std::source_location::current())
      : code_(code), location_(loc) {}

  // ===========================
  // 附加診斷資訊
  // ===========================

  /// @brief 附加「宣告值 vs 實際值」
  Error& with_values(int64_t expected, int64_t actual) noexcept {
    expected_ = expected;
    actual_ = actual;
    return *this;
  }

  /// @brief 附加錯誤發生的 byte offset
  Error& at(size_t offset) noexcept {
    offset_ = offset;
    return *this;
  }

  /// @brief 附加相關的 Tag 號碼
  Error& for_tag(int tag) noexcept {
    tag_ = tag;
    return *this;
  }

  // ===========================
  // 訪問器
  // ===========================

  [[nodiscard]] std::error_code code() const noexcept { return code_; }
  [[nodiscard]] std::optional<int64_t> expected() const noexcept {
    return expected_;
  }
  [[nodiscard]] std::optional<int64_t> actual() const noexcept {
    return actual_;
  }
  [[nodiscard]] std::optional<size_t> offset() const noexcept {
    return offset_;
  }
  [[nodiscard]] std::optional<int> tag() const noexcept { return tag_; }
  [[nodiscard]] const std::source_location& location() const noexcept {
    return location_;
  }

  /// @brief 產生完整的錯誤訊息
  /// @details 格式範例：
  ///   "[fx.protocols.fix:6]: Checksum mismatch (expected 163, actual 12)"
  [[nodiscard]] std::string message() const;

  // ===========================
  // 錯誤檢查
  // ===========================

  /// @brief 檢查錯誤是否匹配特定錯誤碼
  /// @note 支援任何定義了 make_error_code() 的錯誤枚舉類型
  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  [[nodiscard]] bool is(Errc ec) const noexcept {
    return code_ == make_error_code(ec);
  }
};

/// @brief 可能失敗調用的標準回傳類型別名
/// @tparam T 成功的數值類型，預設為 void
template <typename T = void>
using Result = std::expected<T, Error>;

/// @brief 產生錯誤結果
/// @param ec 錯誤代碼
/// @param loc 自動捕捉呼叫處的原始碼位置
/// @warning 此函式應僅在錯誤源頭呼叫。
[[nodiscard]] inline std::unexpected<Error> fail(
    std::error_code ec,
    std::source_location loc = std::source_location::current()) {
  return std::unexpected(Error(ec, loc));
}

/// @brief 產生帶 byte offset 的錯誤結果
[[nodiscard]] inline std::unexpected<Error> fail_at(
    std::error_code ec, size_t offset,
    std::source_location loc = std::source_location::current()) {
  Error err(ec, loc);
  err.at(offset);
  return std::unexpected(std::move(err));
}

/// @brief 產生與特定 Tag 相關的錯誤結果
[[nodiscard]] inline std::unexpected<Error> fail_tag(
    std::error_code ec, int tag,
    std::source_location loc = std::source_location::current()) {
  Error err(ec, loc);
  err.for_tag(tag);
  return std::unexpected(std::move(err));
}

/// @brief 產生帶「宣告值 vs 實際值」的錯誤結果
[[nodiscard]] inline std::unexpected<Error> fail_mismatch(
    std::error_code ec, int64_t expected, int64_t actual,
    std::source_location loc = std::source_location::current()) {
  Error err(ec, loc);
  err.with_values(expected, actual);
  return std::unexpected(std::move(err));
}

}  // namespace fx

/// @brief 支持 fmt
template <>
struct fmt::formatter<fx::Error> : fmt::formatter<std::string> {
  auto format(const fx::Error& err, format_context& ctx) const {
    return fmt::formatter<std::string>::format(err.message(), ctx);
  }
};

/// @brief 解包 std::expected<T, E>，失敗時提前返回
/// @details 使用 GNU Statement Expression 提供類似 Rust ? operator 的語法
/// @warning 只能在返回 std::expected<T, E> 的函數中使用
///
/// @example
///   auto info = TRY(validate(buffer));
///
#define TRY(expr)                                                   \
  __extension__({                                                   \
    auto&& _res = (expr);                                           \
                                                                    \
    static_assert(                                                  \
        requires {                                                  \
          _res.error();                                             \
          _res.has_value();                                         \
        }, "TRY() can only be used with std::expected-like types"); \
                                                                    \
    if (!_res) [[unlikely]] {                                       \
      return std::unexpected(std::move(_res.error()));              \
    }                                                               \
                                                                    \
    std::move(*_res);                                               \
  })

/// @brief 檢查 std::expected<void, E>，失敗時提前返回
/// 用於不需要返回值的場景
/// @warning 只能在返回 std::expected<T, E> 的函數中使用
///
/// @example
///   CHECK(tokenize(buffer, body_start, trailer_start, registry, fields));
///
#define CHECK(expr)                                                   \
  do {                                                                \
    auto&& _res = (expr);                                             \
                                                                      \
    static_assert(                                                    \
        requires {                                                    \
          _res.error();                                               \
          _res.has_value();                                           \
        }, "CHECK() can only be used with std::expected-like types"); \
                                                                      \
    if (!_res) [[unlikely]] {                                         \
      return std::unexpected(_res.error());                           \
    }                                                                 \
  } while (0)

#endif
