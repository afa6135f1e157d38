#ifndef FX_PARSER_PROTOCOLS_FIX_FIELD_HPP
#define FX_PARSER_PROTOCOLS_FIX_FIELD_HPP

#include <cstddef>
#include <cstdint>

namespace fx::protocols::fix {

/// @brief SOH (Start of Header)
/// @details
///   \x01 表示 16 進制的 1，為 ASCII 的 Non-printable character
inline constexpr char SOH = '\x01';
inline constexpr char EQUAL_SIGN = '=';

namespace tags {
inline constexpr int Account = 1;
inline constexpr int AvgPx = 6;
inline constexpr int BeginString = 8;
inline constexpr int BodyLength = 9;
inline constexpr int Checksum = 10;
inline constexpr int ClOrdID = 11;
inline constexpr int CumQty = 14;
inline constexpr int Currency = 15;
inline constexpr int ExecID = 17;
inline constexpr int ExecInst = 18;
inline constexpr int LastPx = 31;
inline constexpr int LastQty = 32;
inline constexpr int MsgSeqNum = 34;
inline constexpr int MsgType = 35;
inline constexpr int OrderID = 37;
inline constexpr int OrderQty = 38;
inline constexpr int OrdStatus = 39;
inline constexpr int OrdType = 40;
inline constexpr int PossDupFlag = 43;
inline constexpr int Price = 44;
inline constexpr int SenderCompID = 49;
inline constexpr int SendingTime = 52;
inline constexpr int Side = 54;
inline constexpr int Symbol = 55;
inline constexpr int TargetCompID = 56;
inline constexpr int Text = 58;
inline constexpr int TimeInForce = 59;
inline constexpr int TransactTime = 60;
inline constexpr int NoOrders = 73;
inline constexpr int Signature = 89;
inline constexpr int SecureDataLen = 90;
inline constexpr int SecureData = 91;
inline constexpr int SignatureLength = 93;
inline constexpr int RawDataLength = 95;
inline constexpr int RawData = 96;
inline constexpr int PossResend = 97;
inline constexpr int Issuer = 106;
inline constexpr int SecurityDesc = 107;
inline constexpr int OrigSendingTime = 122;
inline constexpr int ExpireTime = 126;
inline constexpr int ExecType = 150;
inline constexpr int LeavesQty = 151;
inline constexpr int SecurityExchange = 207;
inline constexpr int XmlDataLen = 212;
inline constexpr int XmlData = 213;
inline constexpr int MDEntryTime = 273;
inline constexpr int MessageEncoding = 347;
inline constexpr int EncodedTextLen = 354;
inline constexpr int EncodedText = 355;
inline constexpr int NoPartyIDs = 453;

}  // namespace tags

namespace constraints {

inline constexpr size_t kDefaultFieldCapacity = 32;
inline constexpr size_t kMaxBodyLength = 99999;
inline constexpr unsigned kChecksumModulo = 256;
inline constexpr size_t kChecksumDigits = 3;
/// @brief "10=ccc<SOH>" 固定 7 bytes
/// @note 假設 checksum 一定補齊 3 位數，並非所有實作都保證
inline constexpr size_t kTrailerSize = 3 + kChecksumDigits + 1;

}  // namespace constraints

/// @brief Tag 的語意型別
enum class SemanticType : uint8_t {
  Int,
  Float,
  Char,
  Boolean,
  Data,
  String,
  Date,
  Time,
};

/// @brief Tag 的特殊屬性
enum class TagProperty : uint8_t {
  None,
  Repeated,          ///< Repeating group 的數量欄位
  DataLength,        ///< 宣告下一個 Data 欄位的長度
  Data,              ///< 原始 bytes，可能包含 SOH
  Encoded,           ///< 依訊息設定的編碼解碼
  MultiValueString,  ///< 以空白分隔的多值字串
};

struct TagDescriptor {
  int key;
  SemanticType type;
  TagProperty property;

  /// @brief 是否為查無此 Tag 時的預設描述
  [[nodiscard]] constexpr bool is_unknown() const noexcept { return key == 0; }
};

/// @brief 查無 Tag 時回傳的預設描述（Int, None）
inline constexpr TagDescriptor kUnknownTag{0, SemanticType::Int,
                                           TagProperty::None};

/// @brief 欄位在 buffer 中的位置（零拷貝）
/// @details
///   buffer: ...<SOH>tag=value<SOH>...
///                   ^   ^    ^
///         tag_start ┘   │    └ value_end (SOH 位置)
///           value_start ┘
struct FieldDescriptor {
  int tag;
  const TagDescriptor* descriptor;
  size_t tag_start;
  size_t value_start;
  size_t value_end;

  [[nodiscard]] size_t value_size() const noexcept {
    return value_end - value_start;
  }
};

}  // namespace fx::protocols::fix

#endif
