#include "fx/error.hpp"

#include <fmt/format.h>

#include <iterator>

namespace fx {

std::string Error::message() const {
  std::string out = fmt::format("[{}:{}]: {}", code_.category().name(),
                                code_.value(), code_.message());

  if (tag_.has_value()) {
    fmt::format_to(std::back_inserter(out), " [tag {}]", *tag_);
  }
  if (expected_.has_value() && actual_.has_value()) {
    fmt::format_to(std::back_inserter(out), " (expected {}, actual {})",
                   *expected_, *actual_);
  }
  if (offset_.has_value()) {
    fmt::format_to(std::back_inserter(out), " at offset {}", *offset_);
  }

  return out;
}

}  // namespace fx
