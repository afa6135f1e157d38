#include "fx/protocols/fix/tokenizer.hpp"

#include <limits>

#include "fx/protocols/fix/error.hpp"
#include "fx/protocols/fix/scan.hpp"

namespace fx::protocols::fix {

namespace {

/// @brief Tag 號碼上限（8 位數），防止 int 溢位
constexpr int kMaxTagNumber = 99'999'999;

[[nodiscard]] bool accumulate_tag(int& tag, char c) noexcept {
  if (tag > kMaxTagNumber / 10) [[unlikely]] {
    return false;
  }
  tag = tag * 10 + (c - '0');
  return true;
}

/// @brief 單次掃描的狀態機
/// @details
///   ReadingKey --'='--> ReadingValue   --SOH--> ReadingKey
///                   \-> ReadingRawData --skip N, SOH--> ReadingKey
///   (當前 Tag 為 Data 且前一個欄位宣告了長度時進入 ReadingRawData)
Result<void> tokenize_one_pass(std::string_view buffer, size_t body_start,
                               size_t trailer_start,
                               const TagRegistry& registry,
                               std::vector<FieldDescriptor>& out) {
  enum class State : uint8_t { ReadingKey, ReadingValue, ReadingRawData };

  constexpr uint64_t kMaxDataLength = std::numeric_limits<uint32_t>::max();

  State state = State::ReadingKey;
  FieldDescriptor field{.tag = 0,
                        .descriptor = &kUnknownTag,
                        .tag_start = body_start,
                        .value_start = 0,
                        .value_end = 0};
  bool has_key_digit = false;
  uint64_t length = 0;  // 正在讀取的 DataLength 值
  uint32_t data_length = 0;
  bool has_pending_length = false;

  size_t i = body_start;
  while (i < trailer_start || state == State::ReadingRawData) {
    switch (state) {
      case State::ReadingKey: {
        char c = buffer[i];
        if (c == EQUAL_SIGN) {
          if (!has_key_digit) [[unlikely]] {
            return fail_at(FixErrc::MalformedTagNumber, i);
          }
          field.descriptor = &registry.lookup(field.tag);
          field.value_start = i + 1;

          // 宣告的長度只對緊接著的欄位有效
          bool raw = field.descriptor->property == TagProperty::Data &&
                     has_pending_length;
          has_pending_length = false;
          length = 0;
          state = raw ? State::ReadingRawData : State::ReadingValue;
        } else if (!is_digit(c) || !accumulate_tag(field.tag, c))
            [[unlikely]] {
          return fail_at(FixErrc::MalformedTagNumber, i);
        } else {
          has_key_digit = true;
        }
        ++i;
        break;
      }

      case State::ReadingValue: {
        char c = buffer[i];
        bool is_length = field.descriptor->property == TagProperty::DataLength;
        if (c == SOH) {
          if (is_length) {
            if (i == field.value_start) [[unlikely]] {
              return fail_at(FixErrc::MalformedInteger, i);
            }
            data_length = static_cast<uint32_t>(length);
            has_pending_length = true;
          }
          field.value_end = i;
          out.push_back(field);

          field = {.tag = 0,
                   .descriptor = &kUnknownTag,
                   .tag_start = i + 1,
                   .value_start = 0,
                   .value_end = 0};
          has_key_digit = false;
          state = State::ReadingKey;
        } else if (is_length) {
          if (!is_digit(c)) [[unlikely]] {
            return fail_at(FixErrc::MalformedInteger, i);
          }
          length = length * 10 + static_cast<uint64_t>(c - '0');
          if (length > kMaxDataLength) [[unlikely]] {
            return fail_at(FixErrc::MalformedInteger, i);
          }
        }
        ++i;
        break;
      }

      case State::ReadingRawData: {
        // 先檢查長度再整段跳過；結尾的 SOH 也必須在 trailer 之前
        if (data_length >= trailer_start - field.value_start) [[unlikely]] {
          return fail_at(FixErrc::DataLengthOverflow, field.value_start);
        }
        size_t end = field.value_start + data_length;
        if (buffer[end] != SOH) [[unlikely]] {
          return fail_at(FixErrc::MissingDataTerminator, end);
        }
        field.value_end = end;
        out.push_back(field);

        data_length = 0;
        field = {.tag = 0,
                 .descriptor = &kUnknownTag,
                 .tag_start = end + 1,
                 .value_start = 0,
                 .value_end = 0};
        has_key_digit = false;
        state = State::ReadingKey;
        i = end + 1;
        break;
      }
    }
  }

  if (state != State::ReadingKey || has_key_digit) [[unlikely]] {
    return fail_at(FixErrc::UnterminatedField, field.tag_start);
  }
  return {};
}

/// @brief 逐欄位定位：先找 '='，再找 SOH 或跳過宣告長度
Result<void> tokenize_two_pass(std::string_view buffer, size_t body_start,
                               size_t trailer_start,
                               const TagRegistry& registry,
                               std::vector<FieldDescriptor>& out) {
  // 所有 find() 都限制在 trailer 之前
  std::string_view body = buffer.substr(0, trailer_start);

  uint32_t data_length = 0;
  bool has_pending_length = false;

  size_t pos = body_start;
  while (pos < trailer_start) {
    FieldDescriptor field{.tag = 0,
                          .descriptor = &kUnknownTag,
                          .tag_start = pos,
                          .value_start = 0,
                          .value_end = 0};

    size_t eq_pos = body.find(EQUAL_SIGN, pos);
    size_t key_end = eq_pos == std::string_view::npos ? trailer_start : eq_pos;
    for (size_t k = pos; k < key_end; ++k) {
      if (!is_digit(body[k]) || !accumulate_tag(field.tag, body[k]))
          [[unlikely]] {
        return fail_at(FixErrc::MalformedTagNumber, k);
      }
    }
    if (eq_pos == std::string_view::npos) [[unlikely]] {
      return fail_at(FixErrc::UnterminatedField, pos);
    }
    if (eq_pos == pos) [[unlikely]] {
      return fail_at(FixErrc::MalformedTagNumber, pos);
    }

    field.descriptor = &registry.lookup(field.tag);
    field.value_start = eq_pos + 1;

    if (field.descriptor->property == TagProperty::Data &&
        has_pending_length) {
      if (data_length >= trailer_start - field.value_start) [[unlikely]] {
        return fail_at(FixErrc::DataLengthOverflow, field.value_start);
      }
      field.value_end = field.value_start + data_length;
      if (buffer[field.value_end] != SOH) [[unlikely]] {
        return fail_at(FixErrc::MissingDataTerminator, field.value_end);
      }
    } else {
      size_t soh_pos = body.find(SOH, field.value_start);
      if (soh_pos == std::string_view::npos) [[unlikely]] {
        return fail_at(FixErrc::UnterminatedField, field.tag_start);
      }
      field.value_end = soh_pos;
    }
    has_pending_length = false;

    if (field.descriptor->property == TagProperty::DataLength) {
      auto length = TRY(parse_uint(body, field.value_start));
      data_length = length.value;
      has_pending_length = true;
    }

    out.push_back(field);
    pos = field.value_end + 1;
  }

  return {};
}

}  // namespace

std::string_view to_string(TokenizerStrategy strategy) noexcept {
  switch (strategy) {
    case TokenizerStrategy::OnePass:
      return "OnePass";
    case TokenizerStrategy::TwoPass:
      return "TwoPass";
  }
  return "Unknown";
}

Result<void> tokenize(std::string_view buffer, size_t body_start,
                      size_t trailer_start, const TagRegistry& registry,
                      std::vector<FieldDescriptor>& out,
                      TokenizerStrategy strategy) {
  if (trailer_start > buffer.size() || body_start > trailer_start)
      [[unlikely]] {
    return fail_mismatch(FixErrc::LengthMismatch,
                         static_cast<int64_t>(trailer_start),
                         static_cast<int64_t>(buffer.size()));
  }

  switch (strategy) {
    case TokenizerStrategy::OnePass:
      return tokenize_one_pass(buffer, body_start, trailer_start, registry,
                               out);
    case TokenizerStrategy::TwoPass:
      return tokenize_two_pass(buffer, body_start, trailer_start, registry,
                               out);
  }
  return tokenize_one_pass(buffer, body_start, trailer_start, registry, out);
}

}  // namespace fx::protocols::fix
