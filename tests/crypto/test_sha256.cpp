// ZKANCHOR - SHA256 and Hex Tests
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include <gtest/gtest.h>
#include "zkanchor/crypto/sha256.h"
#include "zkanchor/core/hex.h"

#include <stdexcept>
#include <string>

namespace zkanchor {
namespace test {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

std::string HashHex(const std::string& input) {
    Sha256Digest digest = SHA256Hash(reinterpret_cast<const Byte*>(input.data()),
                                     input.size());
    return BytesToHex(digest);
}

} // namespace

// ============================================================================
// NIST Test Vectors
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(HashHex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, ABC) {
    EXPECT_EQ(HashHex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(HashHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Hashing
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    hasher.Write(std::string("abcdbcdecdefdefg"))
          .Write(std::string("efghfghighijhijkijkljklmklmnlmnomnopnopq"));

    Sha256Digest digest;
    hasher.Finalize(digest.data());
    EXPECT_EQ(BytesToHex(digest),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    Sha256Digest first;
    hasher.Write(std::string("junk")).Finalize(first.data());

    Sha256Digest second;
    hasher.Reset().Write(std::string("abc")).Finalize(second.data());
    EXPECT_EQ(BytesToHex(second),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, ByteVectorOverload) {
    ByteVector data{'a', 'b', 'c'};
    EXPECT_EQ(SHA256Hash(data), SHA256Hash(data.data(), data.size()));
}

// ============================================================================
// Hex Encoding
// ============================================================================

TEST(HexTest, RoundTrip) {
    ByteVector bytes{0x00, 0x7f, 0x80, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "007f80ff");
    EXPECT_EQ(HexToBytes("007F80ff"), bytes);
    EXPECT_EQ(HexToBytes("0x007f80ff"), bytes);
}

TEST(HexTest, Validation) {
    EXPECT_TRUE(IsValidHex("deadBEEF"));
    EXPECT_TRUE(IsValidHex("0x00"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("zz"));
}

TEST(HexTest, MalformedInputThrows) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("gg"), std::invalid_argument);
}

TEST(HexTest, NibblesAndPrefix) {
    EXPECT_EQ(HexCharToNibble('0'), 0);
    EXPECT_EQ(HexCharToNibble('a'), 10);
    EXPECT_EQ(HexCharToNibble('F'), 15);
    EXPECT_EQ(HexCharToNibble('x'), -1);
    EXPECT_EQ(StripHexPrefix("0Xab"), "ab");
    EXPECT_EQ(StripHexPrefix("ab"), "ab");
}

} // namespace test
} // namespace zkanchor
