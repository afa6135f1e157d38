#ifndef FX_PARSER_PROTOCOLS_FIX_TAG_REGISTRY_HPP
#define FX_PARSER_PROTOCOLS_FIX_TAG_REGISTRY_HPP

#include <span>
#include <vector>

#include "fx/protocols/fix/field.hpp"

namespace fx::protocols::fix {

/// @brief Tag 號碼 → 語意型別與屬性
/// @details
///   - 建構後唯讀，可在多執行緒間無鎖共享
///   - 以 Tag 號碼為索引的稠密表，查詢為 O(1) 且無 hash
///   - 查無此 Tag 時回傳 kUnknownTag（Int, None）
class TagRegistry {
 public:
  /// @brief 稠密表上限，涵蓋 FIX 使用者自訂範圍 (5000-49999)
  static constexpr int kMaxTag = 65535;

 private:
  std::vector<TagDescriptor> entries_;
  std::vector<const TagDescriptor*> index_;

 public:
  /// @brief 由自訂表建立（例如交易所自訂 Tag）
  /// @note 同一個 key 出現多次時以最後一筆為準；key 不在 (0, kMaxTag] 的項目會被忽略
  explicit TagRegistry(std::span<const TagDescriptor> table);

  TagRegistry(const TagRegistry&) = delete;
  TagRegistry& operator=(const TagRegistry&) = delete;
  TagRegistry(TagRegistry&&) noexcept = default;
  TagRegistry& operator=(TagRegistry&&) noexcept = default;

  /// @brief 內建 FIX 4.4 子集，程序啟動後第一次呼叫時建立
  [[nodiscard]] static const TagRegistry& standard();

  /// @brief 內建表內容
  [[nodiscard]] static std::span<const TagDescriptor> standard_table() noexcept;

  [[nodiscard]] const TagDescriptor& lookup(int tag) const noexcept {
    if (tag > 0 && static_cast<size_t>(tag) < index_.size()) [[likely]] {
      const TagDescriptor* desc = index_[static_cast<size_t>(tag)];
      if (desc != nullptr) {
        return *desc;
      }
    }
    return kUnknownTag;
  }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
};

}  // namespace fx::protocols::fix

#endif
