#include "fx/text/encoding.hpp"

#include <algorithm>
#include <cctype>

#include "fx/protocols/fix/error.hpp"

namespace fx::text {

namespace {

using protocols::fix::FixErrc;

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

/// @brief 嚴格 UTF-8 驗證（拒絕 overlong、surrogate 與 > U+10FFFF）
/// @return 第一個不合法 byte 的位置，全部合法時回傳 bytes.size()
[[nodiscard]] size_t find_invalid_utf8(std::string_view bytes) noexcept {
  size_t i = 0;
  while (i < bytes.size()) {
    auto b0 = static_cast<unsigned char>(bytes[i]);
    if (b0 < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
      len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
      len = 3;
      if (b0 == 0xE0) lo = 0xA0;  // overlong
      if (b0 == 0xED) hi = 0x9F;  // surrogate
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
      len = 4;
      if (b0 == 0xF0) lo = 0x90;  // overlong
      if (b0 == 0xF4) hi = 0x8F;  // > U+10FFFF
    } else {
      return i;
    }

    if (i + len > bytes.size()) {
      return i;
    }
    auto b1 = static_cast<unsigned char>(bytes[i + 1]);
    if (b1 < lo || b1 > hi) {
      return i;
    }
    for (size_t k = 2; k < len; ++k) {
      auto bk = static_cast<unsigned char>(bytes[i + k]);
      if (bk < 0x80 || bk > 0xBF) {
        return i;
      }
    }
    i += len;
  }
  return bytes.size();
}

}  // namespace

std::string_view to_string(Encoding encoding) noexcept {
  switch (encoding) {
    case Encoding::Ascii:
      return "US-ASCII";
    case Encoding::Latin1:
      return "ISO-8859-1";
    case Encoding::Utf8:
      return "UTF-8";
  }
  return "Unknown";
}

std::optional<Encoding> encoding_from_name(std::string_view name) noexcept {
  if (iequals(name, "US-ASCII") || iequals(name, "ASCII")) {
    return Encoding::Ascii;
  }
  if (iequals(name, "ISO-8859-1") || iequals(name, "Latin1")) {
    return Encoding::Latin1;
  }
  if (iequals(name, "UTF-8") || iequals(name, "UTF8")) {
    return Encoding::Utf8;
  }
  return std::nullopt;
}

Result<std::string> decode(std::string_view bytes, Encoding encoding) {
  switch (encoding) {
    case Encoding::Ascii: {
      auto it = std::ranges::find_if(
          bytes, [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
      if (it != bytes.end()) {
        return fail_at(FixErrc::InvalidEncoding,
                       static_cast<size_t>(it - bytes.begin()));
      }
      return std::string(bytes);
    }

    case Encoding::Latin1: {
      std::string out;
      out.reserve(bytes.size() * 2);
      for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        if (b < 0x80) {
          out.push_back(c);
        } else {
          out.push_back(static_cast<char>(0xC0 | (b >> 6)));
          out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
      }
      return out;
    }

    case Encoding::Utf8: {
      size_t bad = find_invalid_utf8(bytes);
      if (bad != bytes.size()) {
        return fail_at(FixErrc::InvalidEncoding, bad);
      }
      return std::string(bytes);
    }
  }
  return fail(FixErrc::InvalidEncoding);
}

}  // namespace fx::text
