#include "fx/protocols/fix/validator.hpp"

#include "fx/protocols/fix/error.hpp"
#include "fx/protocols/fix/field.hpp"
#include "fx/protocols/fix/scan.hpp"

namespace fx::protocols::fix {

namespace {

constexpr std::string_view kBeginStringTag = "8=";
constexpr std::string_view kBodyLengthTag = "9=";
constexpr std::string_view kMsgTypeTag = "35=";
constexpr std::string_view kChecksumTag = "10=";

[[nodiscard]] bool starts_with_at(std::string_view buffer, size_t pos,
                                  std::string_view prefix) noexcept {
  return pos <= buffer.size() && buffer.substr(pos).starts_with(prefix);
}

}  // namespace

uint8_t compute_checksum(std::string_view bytes) noexcept {
  uint32_t sum = 0;
  for (char c : bytes) {
    sum += static_cast<unsigned char>(c);
  }
  return static_cast<uint8_t>(sum % constraints::kChecksumModulo);
}

Result<ValidationInfo> validate(std::string_view buffer) {
  ValidationInfo info{};

  // 1. BeginString: Tag 8
  if (!buffer.starts_with(kBeginStringTag)) {
    return fail_at(FixErrc::HeaderTagMismatch, 0);
  }
  info.begin_string_end = find_next_of(buffer, kBeginStringTag.size(), SOH);
  info.begin_string =
      buffer.substr(kBeginStringTag.size(),
                    info.begin_string_end - kBeginStringTag.size());

  // 2. BodyLength: Tag 9
  size_t length_tag_start = info.begin_string_end + 1;
  if (!starts_with_at(buffer, length_tag_start, kBodyLengthTag)) {
    return fail_at(FixErrc::LengthTagMismatch, length_tag_start);
  }
  auto body_length =
      TRY(parse_uint(buffer, length_tag_start + kBodyLengthTag.size()));
  info.declared_body_length = body_length.value;
  info.body_start = body_length.end + 1;

  // 3. MsgType: Tag 35
  if (!starts_with_at(buffer, info.body_start, kMsgTypeTag)) {
    return fail_at(FixErrc::MsgTypeTagMismatch, info.body_start);
  }
  size_t msg_type_start = info.body_start + kMsgTypeTag.size();
  size_t msg_type_end = find_next_of(buffer, msg_type_start, SOH);
  // MsgType 不可為空
  if (msg_type_end >= buffer.size() || msg_type_end == msg_type_start) {
    return fail_at(FixErrc::MsgTypeTagMismatch, info.body_start);
  }
  info.msg_type =
      buffer.substr(msg_type_start, msg_type_end - msg_type_start);

  // 4. Trailer: "10=ccc<SOH>" 固定在最後 7 bytes
  if (buffer.size() < msg_type_end + 1 + constraints::kTrailerSize) {
    return fail(FixErrc::TrailerTagMismatch);
  }
  info.trailer_start = buffer.size() - constraints::kTrailerSize;
  if (!starts_with_at(buffer, info.trailer_start, kChecksumTag) ||
      buffer.back() != SOH) {
    return fail_at(FixErrc::TrailerTagMismatch, info.trailer_start);
  }
  auto checksum =
      parse_uint(buffer, info.trailer_start + kChecksumTag.size());
  if (!checksum ||
      checksum->end != buffer.size() - 1) {  // 必須剛好 3 位數
    return fail_at(FixErrc::TrailerTagMismatch, info.trailer_start);
  }

  // 5. BodyLength
  auto actual_length =
      static_cast<int64_t>(info.trailer_start - info.body_start);
  if (info.declared_body_length != actual_length) {
    return fail_mismatch(FixErrc::LengthMismatch, info.declared_body_length,
                         actual_length);
  }

  // 6. Checksum: 從訊息開頭到 "10=" 之前
  uint8_t computed = compute_checksum(buffer.substr(0, info.trailer_start));
  if (checksum->value != computed) {
    return fail_mismatch(FixErrc::ChecksumMismatch, checksum->value,
                         computed);
  }
  info.checksum = computed;

  return info;
}

}  // namespace fx::protocols::fix
