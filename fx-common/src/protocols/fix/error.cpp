#include "fx/protocols/fix/error.hpp"

namespace fx::protocols::fix {

std::string FixCategory::message(int ec) const {
  using enum FixErrc;
  switch (static_cast<FixErrc>(ec)) {
    case HeaderTagMismatch:
      return "Header tag mismatch (expected BeginString 8=)";
    case LengthTagMismatch:
      return "Length tag mismatch (expected BodyLength 9=)";
    case MsgTypeTagMismatch:
      return "MsgType tag mismatch (expected 35=)";
    case TrailerTagMismatch:
      return "Trailer tag mismatch (expected 10=ccc<SOH>)";
    case LengthMismatch:
      return "BodyLength mismatch";
    case ChecksumMismatch:
      return "Checksum mismatch";
    case MalformedTagNumber:
      return "Malformed tag number";
    case MalformedInteger:
      return "Malformed integer";
    case DataLengthOverflow:
      return "Data length exceeds trailer boundary";
    case MissingDataTerminator:
      return "Missing SOH after data field";
    case UnterminatedField:
      return "Field not terminated before trailer";
    case TagNotFound:
      return "Tag not found";
    case TypeMismatch:
      return "Tag type mismatch";
    case MalformedDate:
      return "Malformed date";
    case InvalidEncoding:
      return "Invalid text encoding";
    case BodyLengthExceeded:
      return "BodyLength exceeds maximum";
  }
  return "Unknown FIX error";
}

const std::error_category& category() noexcept {
  const static FixCategory instance;
  return instance;
}

std::error_code make_error_code(FixErrc ec) noexcept {
  return {static_cast<int>(ec), category()};
}

}  // namespace fx::protocols::fix
