#include "fx/protocols/fix/tag_registry.hpp"

#include <algorithm>
#include <array>

namespace fx::protocols::fix {

namespace {

using enum SemanticType;
using P = TagProperty;

// NOTE: 價格與數量類 Tag 沿用舊表登記為 Int，as_float() 因此接受 Int
constexpr std::array kStandardTable = {
    // Header / Trailer
    TagDescriptor{tags::BeginString, String, P::None},
    TagDescriptor{tags::BodyLength, Int, P::None},
    TagDescriptor{tags::MsgType, String, P::None},
    TagDescriptor{tags::SenderCompID, String, P::None},
    TagDescriptor{tags::TargetCompID, String, P::None},
    TagDescriptor{tags::MsgSeqNum, Int, P::None},
    TagDescriptor{tags::SendingTime, Date, P::None},
    TagDescriptor{tags::OrigSendingTime, Date, P::None},
    TagDescriptor{tags::PossDupFlag, Boolean, P::None},
    TagDescriptor{tags::PossResend, Boolean, P::None},
    TagDescriptor{tags::MessageEncoding, String, P::None},
    TagDescriptor{tags::Checksum, String, P::None},

    // Order / Execution
    TagDescriptor{tags::Account, String, P::None},
    TagDescriptor{tags::ClOrdID, String, P::None},
    TagDescriptor{tags::OrderID, String, P::None},
    TagDescriptor{tags::ExecID, String, P::None},
    TagDescriptor{tags::ExecInst, String, P::MultiValueString},
    TagDescriptor{tags::ExecType, Char, P::None},
    TagDescriptor{tags::OrdStatus, Char, P::None},
    TagDescriptor{tags::OrdType, Char, P::None},
    TagDescriptor{tags::Side, Char, P::None},
    TagDescriptor{tags::TimeInForce, Char, P::None},
    TagDescriptor{tags::Symbol, String, P::None},
    TagDescriptor{tags::Currency, String, P::None},
    TagDescriptor{tags::SecurityExchange, String, P::None},
    TagDescriptor{tags::Price, Int, P::None},
    TagDescriptor{tags::LastPx, Int, P::None},
    TagDescriptor{tags::AvgPx, Int, P::None},
    TagDescriptor{tags::OrderQty, Int, P::None},
    TagDescriptor{tags::LastQty, Int, P::None},
    TagDescriptor{tags::CumQty, Int, P::None},
    TagDescriptor{tags::LeavesQty, Int, P::None},
    TagDescriptor{tags::TransactTime, Date, P::None},
    TagDescriptor{tags::ExpireTime, Date, P::None},
    TagDescriptor{tags::MDEntryTime, Time, P::None},

    // 可能含非 ASCII 的文字
    TagDescriptor{tags::Text, String, P::Encoded},
    TagDescriptor{tags::Issuer, String, P::Encoded},
    TagDescriptor{tags::SecurityDesc, String, P::Encoded},

    // Repeating group 數量
    TagDescriptor{tags::NoOrders, Int, P::Repeated},
    TagDescriptor{tags::NoPartyIDs, Int, P::Repeated},

    // Data length & Data
    TagDescriptor{tags::SecureDataLen, Int, P::DataLength},
    TagDescriptor{tags::SecureData, Data, P::Data},
    TagDescriptor{tags::SignatureLength, Int, P::DataLength},
    TagDescriptor{tags::Signature, Data, P::Data},
    TagDescriptor{tags::RawDataLength, Int, P::DataLength},
    TagDescriptor{tags::RawData, Data, P::Data},
    TagDescriptor{tags::XmlDataLen, Int, P::DataLength},
    TagDescriptor{tags::XmlData, Data, P::Data},
    TagDescriptor{tags::EncodedTextLen, Int, P::DataLength},
    TagDescriptor{tags::EncodedText, Data, P::Data},
};

}  // namespace

TagRegistry::TagRegistry(std::span<const TagDescriptor> table)
    : entries_(table.begin(), table.end()) {
  int max_key = 0;
  for (const auto& desc : entries_) {
    if (desc.key > 0 && desc.key <= kMaxTag) {
      max_key = std::max(max_key, desc.key);
    }
  }

  index_.assign(static_cast<size_t>(max_key) + 1, nullptr);
  for (const auto& desc : entries_) {
    if (desc.key > 0 && desc.key <= kMaxTag) {
      index_[static_cast<size_t>(desc.key)] = &desc;
    }
  }
}

const TagRegistry& TagRegistry::standard() {
  const static TagRegistry instance(kStandardTable);
  return instance;
}

std::span<const TagDescriptor> TagRegistry::standard_table() noexcept {
  return kStandardTable;
}

}  // namespace fx::protocols::fix
