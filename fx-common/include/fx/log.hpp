#ifndef FX_PARSER_LOG_HPP
#define FX_PARSER_LOG_HPP

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

namespace fx::log {

enum class Level : uint8_t { Trace, Debug, Info, Warn, Error, Off };

[[nodiscard]] std::string_view to_string(Level level) noexcept;

/// @brief 日誌輸出端，接收已格式化的訊息
using Sink = std::function<void(Level, std::string_view)>;

/// @brief 全域日誌
/// @details
///   - 只在診斷點呼叫（驗證失敗、切分失敗、解析完成），不進入逐 byte 迴圈
///   - level 與 sink 應在開始並行解析前設定好
class Logger {
 private:
  inline static Level level_{Level::Warn};
  static Sink& sink() noexcept;

 public:
  static void set_level(Level level) noexcept { level_ = level; }
  [[nodiscard]] static Level level() noexcept { return level_; }

  [[nodiscard]] static bool enabled(Level level) noexcept {
    return level >= level_ && level != Level::Off;
  }

  /// @brief 替換輸出端
  static void set_sink(Sink sink);

  /// @brief 還原為 stderr 輸出
  static void reset_sink();

  template <typename... Args>
  static void write(Level level, fmt::format_string<Args...> format,
                    Args&&... args) {
    if (!enabled(level)) {
      return;
    }
    emit(level, fmt::format(format, std::forward<Args>(args)...));
  }

 private:
  static void emit(Level level, std::string_view message);
};

}  // namespace fx::log

#define FX_LOG_TRACE(...) \
  ::fx::log::Logger::write(::fx::log::Level::Trace, __VA_ARGS__)
#define FX_LOG_DEBUG(...) \
  ::fx::log::Logger::write(::fx::log::Level::Debug, __VA_ARGS__)
#define FX_LOG_INFO(...) \
  ::fx::log::Logger::write(::fx::log::Level::Info, __VA_ARGS__)
#define FX_LOG_WARN(...) \
  ::fx::log::Logger::write(::fx::log::Level::Warn, __VA_ARGS__)
#define FX_LOG_ERROR(...) \
  ::fx::log::Logger::write(::fx::log::Level::Error, __VA_ARGS__)

#endif
