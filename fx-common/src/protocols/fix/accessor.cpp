#include <charconv>
#include <cstring>
#include <system_error>

#include "fx/protocols/fix/error.hpp"
#include "fx/protocols/fix/message.hpp"
#include "fx/protocols/fix/scan.hpp"

namespace fx::protocols::fix {

Result<const FieldDescriptor*> Message::require(int tag,
                                                SemanticType type) const {
  const FieldDescriptor* field = find_field(tag);
  if (field == nullptr) {
    return fail_tag(FixErrc::TagNotFound, tag);
  }
  if (field->descriptor->type != type) {
    Error err(FixErrc::TypeMismatch);
    err.for_tag(tag).with_values(static_cast<int64_t>(type),
                                 static_cast<int64_t>(field->descriptor->type));
    return std::unexpected(std::move(err));
  }
  return field;
}

Result<std::vector<std::byte>> Message::raw_bytes(int tag) const {
  const FieldDescriptor* field = find_field(tag);
  if (field == nullptr) {
    return fail_tag(FixErrc::TagNotFound, tag);
  }

  std::vector<std::byte> bytes(field->value_size());
  if (!bytes.empty()) {
    std::memcpy(bytes.data(), buffer_.data() + field->value_start,
                bytes.size());
  }
  return bytes;
}

Result<int64_t> Message::as_int(int tag) const {
  const FieldDescriptor* field = TRY(require(tag, SemanticType::Int));

  auto result = parse_int(value(*field));
  if (!result) {
    return fail_at(FixErrc::MalformedInteger, field->value_start);
  }
  return *result;
}

Result<double> Message::as_float(int tag) const {
  const FieldDescriptor* field = find_field(tag);
  if (field == nullptr) {
    return fail_tag(FixErrc::TagNotFound, tag);
  }

  // 價格類 Tag 登記為 Int，只擋掉其他型別
  SemanticType type = field->descriptor->type;
  if (type != SemanticType::Int && type != SemanticType::Float) {
    Error err(FixErrc::TypeMismatch);
    err.for_tag(tag).with_values(static_cast<int64_t>(SemanticType::Float),
                                 static_cast<int64_t>(type));
    return std::unexpected(std::move(err));
  }

  // from_chars 也接受 nan/inf，先確認是十進位格式
  std::string_view text = value(*field);
  if (!is_decimal(text)) {
    return fail_at(FixErrc::MalformedInteger, field->value_start);
  }

  double result = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   result, std::chars_format::fixed);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return fail_at(FixErrc::MalformedInteger, field->value_start);
  }
  return result;
}

Result<std::string> Message::as_string(int tag) const {
  const FieldDescriptor* field = TRY(require(tag, SemanticType::String));

  text::Encoding encoding = field->descriptor->property == TagProperty::Encoded
                                ? options_.encoding
                                : constraints::kDefaultEncoding;

  auto decoded = text::decode(value(*field), encoding);
  if (!decoded) {
    // 轉成訊息內的絕對 offset
    size_t offset = field->value_start + decoded.error().offset().value_or(0);
    return fail_at(FixErrc::InvalidEncoding, offset);
  }
  return std::move(*decoded);
}

Result<Timestamp> Message::as_date(int tag) const {
  const FieldDescriptor* field = TRY(require(tag, SemanticType::Date));
  return parse_timestamp(value(*field));
}

}  // namespace fx::protocols::fix
