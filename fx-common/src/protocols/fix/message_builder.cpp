#include "fx/protocols/fix/message_builder.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <iterator>

#include "fx/protocols/fix/error.hpp"
#include "fx/protocols/fix/validator.hpp"

namespace fx::protocols::fix {

MessageBuilder& MessageBuilder::add_field(int tag, int64_t value) {
  fields_.push_back({tag, fmt::format(FMT_COMPILE("{}"), value)});
  return *this;
}

MessageBuilder& MessageBuilder::add_field(int tag, double value,
                                          int precision) {
  fields_.push_back({tag, fmt::format("{:.{}f}", value, precision)});
  return *this;
}

MessageBuilder& MessageBuilder::add_data_field(int length_tag, int data_tag,
                                               std::string_view payload) {
  fields_.push_back(
      {length_tag, fmt::format(FMT_COMPILE("{}"), payload.size())});
  fields_.push_back({data_tag, std::string(payload)});
  return *this;
}

Result<std::string> MessageBuilder::build() const {
  if (msg_type_.empty()) {
    return fail(FixErrc::MsgTypeTagMismatch);
  }

  // 先構建 body，再計算 body_length，最後組裝完整訊息
  std::string body;
  body.reserve(estimate_size());

  append_field(body, tags::MsgType, msg_type_);
  for (const auto& field : fields_) {
    append_field(body, field.tag, field.value);
  }

  size_t body_length = body.size();
  if (body_length > constraints::kMaxBodyLength) {
    return fail_mismatch(FixErrc::BodyLengthExceeded,
                         static_cast<int64_t>(constraints::kMaxBodyLength),
                         static_cast<int64_t>(body_length));
  }

  std::string result;
  result.reserve(estimate_size());

  append_field(result, tags::BeginString, begin_string_);
  fmt::format_to(std::back_inserter(result), FMT_COMPILE("{}={}\x01"),
                 tags::BodyLength, body_length);
  result.append(body);

  append_checksum(result, compute_checksum(result));

  return result;
}

void MessageBuilder::append_field(std::string& str, int tag,
                                  std::string_view value) {
  fmt::format_to(std::back_inserter(str), FMT_COMPILE("{}={}\x01"), tag, value);
}

void MessageBuilder::append_checksum(std::string& str, unsigned checksum) {
  fmt::format_to(std::back_inserter(str), FMT_COMPILE("{}={:03}\x01"),
                 tags::Checksum, checksum);
}

size_t MessageBuilder::estimate_size() const noexcept {
  size_t size = 0;
  // Tag 8: "8=FIX.4.4\x01" = 11
  size += 2 + begin_string_.size() + 1;

  // Tag 9: "9=12345\x01" = 8 (預留最大值)
  size += constraints::kBodyLengthFieldReserve;

  // Tag 35: "35=D\x01"
  size += 3 + msg_type_.size() + 1;

  for (const auto& field : fields_) {
    // tag 通常是 1-4 位數, =, field 大小, + SOH
    size += 4 + 1 + field.value.size() + 1;
  }

  size += constraints::kTrailerSize;

  return size;
}

}  // namespace fx::protocols::fix
