// BONDVAULT - SHA256 Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/crypto/sha256.h"

#include <string>
#include <utility>
#include <vector>

namespace bondvault {
namespace test {

namespace {

std::string HashHex(const std::string& msg) {
    return SHA256Hash(msg).ToHex();
}

} // namespace

// ============================================================================
// Known Answers (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(HashHex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, ABCString) {
    EXPECT_EQ(HashHex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(HashHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, ChainedWritesMatchOneShot) {
    SHA256 hasher;
    Hash256 digest = hasher.Write("abcdbcdecdefdefgefgh")
                           .Write("fghighijhijkijkljklmklmnlmnomnopnopq")
                           .Finalize();
    EXPECT_EQ(digest.ToHex(),
              HashHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"));
}

TEST(SHA256Test, FinalizeRearmsContext) {
    SHA256 hasher;
    Hash256 first = hasher.Write("abc").Finalize();
    Hash256 second = hasher.Write("abc").Finalize();
    EXPECT_EQ(first, second);
}

TEST(SHA256Test, ResetDiscardsInput) {
    SHA256 hasher;
    hasher.Write("junk").Reset();
    EXPECT_EQ(hasher.Finalize().ToHex(), HashHex(""));
}

TEST(SHA256Test, MovedHasherKeepsState) {
    SHA256 hasher;
    hasher.Write("ab");
    SHA256 moved(std::move(hasher));
    EXPECT_EQ(moved.Write("c").Finalize().ToHex(), HashHex("abc"));
}

TEST(SHA256Test, Overloads) {
    std::vector<Byte> data = {'a', 'b', 'c'};
    EXPECT_EQ(SHA256Hash(data), SHA256Hash(std::string("abc")));
    EXPECT_NE(SHA256Hash(std::string("bondvault.local")), Hash256());
}

} // namespace test
} // namespace bondvault
