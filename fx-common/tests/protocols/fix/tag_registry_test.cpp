#include "fx/protocols/fix/tag_registry.hpp"

#include <gtest/gtest.h>

#include <array>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace fx::protocols::fix::test {

// ===========================
// 內建表
// ===========================

TEST(TagRegistryTest, StandardHeaderTags) {
  const auto& registry = TagRegistry::standard();

  EXPECT_EQ(registry.lookup(tags::BeginString).type, SemanticType::String);
  EXPECT_EQ(registry.lookup(tags::BodyLength).type, SemanticType::Int);
  EXPECT_EQ(registry.lookup(tags::MsgType).type, SemanticType::String);
  EXPECT_EQ(registry.lookup(tags::SendingTime).type, SemanticType::Date);
  EXPECT_EQ(registry.lookup(tags::MDEntryTime).type, SemanticType::Time);
}

TEST(TagRegistryTest, PriceTagsRegisteredAsInt) {
  const auto& registry = TagRegistry::standard();

  EXPECT_EQ(registry.lookup(tags::Price).type, SemanticType::Int);
  EXPECT_EQ(registry.lookup(tags::AvgPx).type, SemanticType::Int);
  EXPECT_EQ(registry.lookup(tags::LastPx).type, SemanticType::Int);
}

TEST(TagRegistryTest, DataLengthPairs) {
  const auto& registry = TagRegistry::standard();

  constexpr std::array<std::pair<int, int>, 5> kPairs = {{
      {tags::SecureDataLen, tags::SecureData},
      {tags::SignatureLength, tags::Signature},
      {tags::RawDataLength, tags::RawData},
      {tags::XmlDataLen, tags::XmlData},
      {tags::EncodedTextLen, tags::EncodedText},
  }};

  for (auto [length_tag, data_tag] : kPairs) {
    const auto& length = registry.lookup(length_tag);
    const auto& data = registry.lookup(data_tag);
    EXPECT_EQ(length.property, TagProperty::DataLength) << "tag " << length_tag;
    EXPECT_EQ(length.type, SemanticType::Int) << "tag " << length_tag;
    EXPECT_EQ(data.property, TagProperty::Data) << "tag " << data_tag;
    EXPECT_EQ(data.type, SemanticType::Data) << "tag " << data_tag;
  }
}

TEST(TagRegistryTest, EncodedAndRepeatedProperties) {
  const auto& registry = TagRegistry::standard();

  EXPECT_EQ(registry.lookup(tags::Text).property, TagProperty::Encoded);
  EXPECT_EQ(registry.lookup(tags::ExecInst).property,
            TagProperty::MultiValueString);
  EXPECT_EQ(registry.lookup(tags::NoPartyIDs).property, TagProperty::Repeated);
  EXPECT_EQ(registry.lookup(tags::Symbol).property, TagProperty::None);
}

TEST(TagRegistryTest, StandardTableHasUniqueKeys) {
  auto table = TagRegistry::standard_table();
  std::set<int> keys;
  for (const auto& desc : table) {
    EXPECT_TRUE(keys.insert(desc.key).second) << "重複的 key " << desc.key;
    EXPECT_FALSE(desc.is_unknown());
  }
  EXPECT_EQ(TagRegistry::standard().size(), table.size());
}

TEST(TagRegistryTest, LookupReturnsRegistryEntry) {
  const auto& registry = TagRegistry::standard();

  // 同一個 Tag 每次回傳同一個 descriptor
  EXPECT_EQ(&registry.lookup(tags::Symbol), &registry.lookup(tags::Symbol));
  EXPECT_EQ(registry.lookup(tags::Symbol).key, tags::Symbol);
}

// ===========================
// Unknown
// ===========================

TEST(TagRegistryTest, UnknownTagDefaultsToInt) {
  const auto& registry = TagRegistry::standard();

  for (int tag : {0, -1, 2, 9999, 65535, 65536, 1'000'000}) {
    const auto& desc = registry.lookup(tag);
    EXPECT_TRUE(desc.is_unknown()) << "tag " << tag;
    EXPECT_EQ(desc.type, SemanticType::Int);
    EXPECT_EQ(desc.property, TagProperty::None);
    EXPECT_EQ(&desc, &kUnknownTag);
  }
}

// ===========================
// 自訂表
// ===========================

TEST(TagRegistryTest, CustomTable) {
  constexpr std::array kTable = {
      TagDescriptor{tags::Symbol, SemanticType::String, TagProperty::None},
      TagDescriptor{5001, SemanticType::Float, TagProperty::None},
  };
  TagRegistry registry(kTable);

  EXPECT_EQ(registry.size(), 2);
  EXPECT_EQ(registry.lookup(5001).type, SemanticType::Float);
  EXPECT_TRUE(registry.lookup(tags::Price).is_unknown());
}

TEST(TagRegistryTest, CustomTableLastDuplicateWins) {
  constexpr std::array kTable = {
      TagDescriptor{5001, SemanticType::Int, TagProperty::None},
      TagDescriptor{5001, SemanticType::String, TagProperty::Encoded},
  };
  TagRegistry registry(kTable);

  EXPECT_EQ(registry.lookup(5001).type, SemanticType::String);
  EXPECT_EQ(registry.lookup(5001).property, TagProperty::Encoded);
}

TEST(TagRegistryTest, CustomTableIgnoresOutOfRangeKeys) {
  constexpr std::array kTable = {
      TagDescriptor{0, SemanticType::String, TagProperty::None},
      TagDescriptor{-5, SemanticType::String, TagProperty::None},
      TagDescriptor{TagRegistry::kMaxTag + 1, SemanticType::String,
                    TagProperty::None},
      TagDescriptor{TagRegistry::kMaxTag, SemanticType::Char,
                    TagProperty::None},
  };
  TagRegistry registry(kTable);

  EXPECT_TRUE(registry.lookup(0).is_unknown());
  EXPECT_TRUE(registry.lookup(TagRegistry::kMaxTag + 1).is_unknown());
  EXPECT_EQ(registry.lookup(TagRegistry::kMaxTag).type, SemanticType::Char);
}

TEST(TagRegistryTest, MoveKeepsLookups) {
  constexpr std::array kTable = {
      TagDescriptor{5001, SemanticType::Float, TagProperty::None},
  };
  TagRegistry source(kTable);
  TagRegistry moved(std::move(source));

  EXPECT_EQ(moved.lookup(5001).type, SemanticType::Float);
  EXPECT_EQ(moved.lookup(5001).key, 5001);
}

// ===========================
// 並行讀取
// ===========================

TEST(TagRegistryTest, ConcurrentLookups) {
  const auto& registry = TagRegistry::standard();

  std::vector<std::thread> threads;
  std::array<int, 4> mismatches{};
  for (size_t t = 0; t < mismatches.size(); ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10000; ++i) {
        if (registry.lookup(tags::RawData).property != TagProperty::Data) {
          ++mismatches[t];
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int count : mismatches) {
    EXPECT_EQ(count, 0);
  }
}

}  // namespace fx::protocols::fix::test
