#include "util/sha256.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(SHA256, Empty) {
  EXPECT_EQ(util::SHA256::Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// NOLINTNEXTLINE
TEST(SHA256, Abc) {
  EXPECT_EQ(util::SHA256::Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// NOLINTNEXTLINE
TEST(SHA256, TwoBlocks) {
  EXPECT_EQ(
      util::SHA256::Hex(
          "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
      "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// NOLINTNEXTLINE
TEST(SHA256, IncrementalUpdate) {
  util::SHA256 hasher;
  std::string chunk(1000, 'a');
  for (int i = 0; i < 1000; i++) hasher.update(chunk);
  util::SHA256_t digest;
  hasher.finalize(&digest);
  EXPECT_FALSE(digest.isZero());
  EXPECT_EQ(digest.Hex(),
            "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

}  // namespace
