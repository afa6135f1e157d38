#ifndef FX_PARSER_TESTS_PROTOCOLS_FIX_FIXTURES_HPP
#define FX_PARSER_TESTS_PROTOCOLS_FIX_FIXTURES_HPP

#include <string>
#include <string_view>

#include "fx/protocols/fix/validator.hpp"

namespace fx::protocols::fix::test {

// ===========================
// 測試用訊息
// ===========================

/// @brief Execution Report，29 個欄位（含 8, 9, 10）
/// @details body_start = 16, trailer_start = 305, checksum = 132
inline const std::string kExecutionReport =
    "8=FIX.4.4\x01"
    "9=289\x01"
    "35=8\x01"
    "49=BROKER\x01"
    "56=CLIENT\x01"
    "34=1024\x01"
    "52=20231010-10:00:00.123\x01"
    "37=ORD-000123\x01"
    "11=CLORD-7781\x01"
    "17=EXEC-55123\x01"
    "150=F\x01"
    "39=2\x01"
    "1=ACCT-01\x01"
    "55=AAPL\x01"
    "54=1\x01"
    "38=100\x01"
    "40=2\x01"
    "44=150.25\x01"
    "59=0\x01"
    "32=100\x01"
    "31=150.25\x01"
    "151=0\x01"
    "14=100\x01"
    "6=150.25\x01"
    "60=20231010-10:00:00\x01"
    "15=USD\x01"
    "207=XNAS\x01"
    "58=Order filled in full on venue XNAS at limit 150.\x01"
    "10=132\x01";

inline constexpr size_t kExecutionReportFields = 29;
inline constexpr size_t kExecutionReportBodyStart = 16;
inline constexpr size_t kExecutionReportTrailerStart = 305;

/// @brief 兩組 Data 欄位（95/96, 90/91），內容含 SOH 與 '='
/// @details
///   - 96: tag_start 36, value [39, 46) = "ab<SOH>c=d<SOH>"
///   - 91: tag_start 52, value [55, 63) = "KEY=<SOH><SOH>=9"
inline const std::string kDataMessage =
    "8=FIX.4.2\x01"
    "9=49\x01"
    "35=U1\x01"
    "49=SENDER\x01"
    "95=7\x01"
    "96=ab\x01"
    "c=d\x01\x01"
    "90=8\x01"
    "91=KEY=\x01\x01"
    "=9\x01"
    "10=025\x01";

inline constexpr size_t kDataMessageFields = 9;

/// @brief Heartbeat，最小的合法訊息
inline const std::string kHeartbeat =
    "8=FIX.4.2\x01"
    "9=15\x01"
    "35=0\x01"
    "49=A\x01"
    "56=B\x01"
    "10=169\x01";

// ===========================
// Helper 函數
// ===========================

/// @brief 用正確的 BodyLength 與 Checksum 包裝 body
/// @param body 從 "35=" 開始，以 SOH 結尾
inline std::string make_message(std::string_view begin_string,
                                std::string_view body) {
  std::string msg = "8=" + std::string(begin_string) + "\x01" + "9=" +
                    std::to_string(body.size()) + "\x01" + std::string(body);
  std::string digits = std::to_string(compute_checksum(msg));
  msg += "10=" + std::string(3 - digits.size(), '0') + digits + "\x01";
  return msg;
}

}  // namespace fx::protocols::fix::test

#endif
