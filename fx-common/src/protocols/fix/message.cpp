#include "fx/protocols/fix/message.hpp"

#include <utility>

#include "fx/log.hpp"
#include "fx/protocols/fix/error.hpp"

namespace fx::protocols::fix {

Message::Message(std::string buffer, ParseOptions options)
    : buffer_(std::move(buffer)), options_(options) {
  if (options_.registry == nullptr) {
    options_.registry = &TagRegistry::standard();
  }
}

void Message::reset() noexcept {
  fields_.clear();
  index_.clear();
  msg_type_.clear();
  info_.reset();
}

Result<void> Message::parse() {
  reset();

  std::string_view buffer = buffer_;
  const TagRegistry& registry = *options_.registry;

  auto validated = validate(buffer);
  if (!validated) {
    FX_LOG_DEBUG("validation failed: {}", validated.error());
    return std::unexpected(std::move(validated.error()));
  }
  const ValidationInfo& info = *validated;

  fields_.reserve(constraints::kDefaultFieldCapacity);

  // Header: Tag 8, Tag 9（位置已由驗證取得）
  size_t length_tag_start = info.begin_string_end + 1;
  fields_.push_back({.tag = tags::BeginString,
                     .descriptor = &registry.lookup(tags::BeginString),
                     .tag_start = 0,
                     .value_start = 2,
                     .value_end = info.begin_string_end});
  fields_.push_back({.tag = tags::BodyLength,
                     .descriptor = &registry.lookup(tags::BodyLength),
                     .tag_start = length_tag_start,
                     .value_start = length_tag_start + 2,
                     .value_end = info.body_start - 1});

  // Body: 從 35= 到 10= 之前
  auto tokenized = tokenize(buffer, info.body_start, info.trailer_start,
                            registry, fields_, options_.strategy);
  if (!tokenized) {
    FX_LOG_DEBUG("tokenize ({}) failed after {} fields: {}",
                 to_string(options_.strategy), fields_.size(),
                 tokenized.error());
    return std::unexpected(std::move(tokenized.error()));
  }

  // Trailer: Tag 10
  fields_.push_back({.tag = tags::Checksum,
                     .descriptor = &registry.lookup(tags::Checksum),
                     .tag_start = info.trailer_start,
                     .value_start = info.trailer_start + 3,
                     .value_end = buffer.size() - 1});

  index_.reserve(fields_.size());
  for (size_t i = 0; i < fields_.size(); ++i) {
    index_[fields_[i].tag] = i;  // 重複 Tag 以最後一個為準
  }

  msg_type_.assign(info.msg_type);

  // 只保留 offset；view 指向 buffer_，複製或搬移後會失效
  info_ = info;
  info_->begin_string = {};
  info_->msg_type = {};

  FX_LOG_TRACE("parsed {} message: {} fields, body length {}", msg_type_,
               fields_.size(), info.declared_body_length);
  return {};
}

const FieldDescriptor* Message::find_field(int tag) const noexcept {
  auto it = index_.find(tag);
  if (it == index_.end()) {
    return nullptr;
  }
  return &fields_[it->second];
}

std::string_view Message::begin_string() const noexcept {
  // 以 offset 從自己的 buffer_ 取得
  if (!info_.has_value()) {
    return {};
  }
  return std::string_view(buffer_).substr(2, info_->begin_string_end - 2);
}

std::optional<uint32_t> Message::body_length() const noexcept {
  if (!info_.has_value()) {
    return std::nullopt;
  }
  return info_->declared_body_length;
}

}  // namespace fx::protocols::fix
