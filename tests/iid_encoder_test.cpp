#include "core/iid_encoder.hpp"

#include <format>
#include <string>
#include <unordered_set>

#include <gtest/gtest.h>

using iid::core::Guid;

namespace {

auto guid(const char* text) -> Guid {
  auto parsed = Guid::parse(text);
  EXPECT_TRUE(parsed) << text;
  return parsed ? *parsed : Guid{};
}

}  // namespace

TEST(TypeHash, Sha1KnownAnswer) {
  auto digest = iid::core::hash_type_bytes({}, "abc");
  const std::array<std::uint8_t, 20> expected{0xa9, 0x99, 0x3e, 0x36, 0x47, 0x06, 0x81,
                                              0x6a, 0xba, 0x3e, 0x25, 0x71, 0x78, 0x50,
                                              0xc2, 0x6c, 0x9c, 0xd0, 0xd8, 0x9d};
  ASSERT_EQ(digest.bytes, expected);
}

TEST(TypeHash, IncrementalMatchesOneShot) {
  iid::core::TypeHasher hasher;
  hasher.update("pinterface(");
  hasher.update("{913337e9-11a1-4345-a3a2-4e7f956e222d};i4)");
  auto split = hasher.finalize();
  auto whole = iid::core::hash_type_bytes({}, "pinterface({913337e9-11a1-4345-a3a2-4e7f956e222d};i4)");
  ASSERT_EQ(split.bytes, whole.bytes);
}

TEST(IidEncoder, NamespaceConstant) {
  ASSERT_EQ(iid::core::kPinterfaceNamespace.to_string(), "11f47ad5-7b73-42c0-abae-878b1e16adee");
}

TEST(IidEncoder, NormalizesDigestLayout) {
  iid::core::TypeDigest digest;
  for (std::size_t i = 0; i < digest.bytes.size(); ++i) {
    digest.bytes[i] = static_cast<std::uint8_t>(i);
  }
  auto g = iid::core::encode_guid(digest);
  ASSERT_EQ(g.to_string(), "00010203-0405-5607-8809-0a0b0c0d0e0f");
}

TEST(IidEncoder, PatchesVersionAndVariantOverSetBits) {
  iid::core::TypeDigest digest;
  digest.bytes.fill(0xFF);
  auto g = iid::core::encode_guid(digest);
  ASSERT_EQ(g.to_string(), "ffffffff-ffff-5fff-bfff-ffffffffffff");
}

TEST(IidEncoder, GoldenParameterizedIds) {
  ASSERT_EQ(iid::core::encode_iid("pinterface({913337e9-11a1-4345-a3a2-4e7f956e222d};i4)"),
            guid("b939af5b-b45d-5489-9149-61442c1905fe"));
  ASSERT_EQ(iid::core::encode_iid("pinterface({faa585ea-6214-4217-afda-7f46de5869b3};string)"),
            guid("e2fcc7c1-3bfc-5a0b-b2b0-72e769d1cb7e"));
  ASSERT_EQ(iid::core::encode_iid("pinterface({61c17706-2d65-11e0-9ae8-d48564015472};g16)"),
            guid("7d50f649-632c-51f9-849a-ee49428933ea"));
  ASSERT_EQ(iid::core::encode_iid(iid::core::kPinterfaceNamespace,
                                  "pinterface({3c2925fe-8519-45c1-aa79-197b6718c1c1};string;"
                                  "cinterface(IInspectable))"),
            guid("1b0d3570-0877-5ec2-8a2c-3b9539506aca"));
}

TEST(IidEncoder, Deterministic) {
  const std::string sig = "pinterface({faa585ea-6214-4217-afda-7f46de5869b3};enum(Sample.Color;u4))";
  ASSERT_EQ(iid::core::encode_iid(sig), iid::core::encode_iid(sig));
  ASSERT_EQ(iid::core::encode_iid(sig), guid("3281be98-254e-5e8f-9c7a-346b19a2c108"));
}

TEST(IidEncoder, NamespaceParticipatesInHash) {
  const std::string sig = "pinterface({faa585ea-6214-4217-afda-7f46de5869b3};string)";
  Guid other{0x6ba7b810, 0x9dad, 0x11d1, {0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
  ASSERT_NE(iid::core::encode_iid(other, sig), iid::core::encode_iid(sig));
}

TEST(IidEncoder, VersionVariantAndNoCollisions) {
  std::unordered_set<Guid> seen;
  constexpr int kSamples = 4096;
  for (int i = 0; i < kSamples; ++i) {
    auto sig = std::format("pinterface({{faa585ea-6214-4217-afda-7f46de5869b3}};struct(S{};i{}))",
                           i, 1 << (i % 4));
    auto g = iid::core::encode_iid(sig);
    ASSERT_EQ(g.version(), 5) << sig;
    ASSERT_EQ(g.variant_bits(), 0b10) << sig;
    ASSERT_TRUE(seen.insert(g).second) << "collision for " << sig;
  }
}
