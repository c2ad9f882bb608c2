#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include "utilities/digest.hpp"

using namespace sharedict;

TEST(DigestTest, KnownVector) {
  auto h = Digest::of(sharedict_test::bytesOf("abc"));
  EXPECT_EQ(toHex(h),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
  const auto data = sharedict_test::randomBytes(1000, 12);
  Digest d;
  d.ingest(std::span<const std::byte>(data).first(300));
  d.ingest(std::span<const std::byte>(data).subspan(300));
  EXPECT_EQ(d.finalize(), Digest::of(data));
  EXPECT_THROW(d.finalize(), std::logic_error);
  EXPECT_THROW(d.ingest(data), std::logic_error);
}

TEST(DigestTest, HexRoundTripAndValidation) {
  auto h = Digest::of(sharedict_test::bytesOf("chunk"));
  EXPECT_EQ(fromHex(toHex(h)), h);
  EXPECT_THROW(fromHex("abcd"), std::invalid_argument);
  EXPECT_THROW(fromHex(std::string(64, 'z')), std::invalid_argument);
}

TEST(DigestTest, OrderIsUnsignedBytewise) {
  ChunkHash a{}, b{};
  a[0] = 0x7f;
  b[0] = 0x80;
  EXPECT_LT(a, b);
}
