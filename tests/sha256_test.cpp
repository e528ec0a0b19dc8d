#include <gtest/gtest.h>

#include "infra/hash/sha256.hpp"
#include "test_helpers.hpp"

using cverify::infra::Sha256Accumulator;
using cverify::infra::sha256_of;
using cverify::test::as_bytes;

namespace {
constexpr auto kEmptyHex = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr auto kAbcHex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

TEST(Sha256Test, EmptyInput)
{
    Sha256Accumulator acc;
    auto digest = acc.finalize();
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest->hex(), kEmptyHex);
}

TEST(Sha256Test, KnownVectorAbc)
{
    auto data = as_bytes("abc");
    auto digest = sha256_of(data);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest->hex(), kAbcHex);
}

TEST(Sha256Test, IncrementalEqualsOneShot)
{
    auto data = cverify::test::random_bytes(100'000);
    Sha256Accumulator acc;
    std::span<const std::byte> all(data);
    for (std::size_t off = 0; off < all.size(); off += 7919) {
        auto piece = all.subspan(off, std::min<std::size_t>(7919, all.size() - off));
        ASSERT_TRUE(acc.update(piece).has_value());
    }
    EXPECT_EQ(acc.bytes_hashed(), data.size());

    auto incremental = acc.finalize();
    auto one_shot = sha256_of(data);
    ASSERT_TRUE(incremental && one_shot);
    EXPECT_EQ(*incremental, *one_shot);
    EXPECT_EQ(incremental->hex(), cverify::test::reference_sha256_hex(data));
}

TEST(Sha256Test, FinalizeTwiceIsAnError)
{
    Sha256Accumulator acc;
    ASSERT_TRUE(acc.update(as_bytes("abc")).has_value());
    ASSERT_TRUE(acc.finalize().has_value());
    EXPECT_TRUE(acc.is_finalized());

    EXPECT_FALSE(acc.finalize().has_value());
    EXPECT_FALSE(acc.update(as_bytes("d")).has_value());
}

TEST(Sha256Test, DigestHexIsLowercase64Chars)
{
    auto digest = sha256_of(as_bytes("The quick brown fox"));
    ASSERT_TRUE(digest.has_value());
    const auto hex = digest->hex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}
