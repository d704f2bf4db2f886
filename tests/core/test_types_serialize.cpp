// BONDVAULT - Core Types and Serialization Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/core/hex.h"
#include "bondvault/core/serialize.h"
#include "bondvault/core/types.h"

#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bondvault {
namespace test {

// ============================================================================
// Hashes and Addresses
// ============================================================================

TEST(TypesTest, DefaultHashIsNull) {
    Hash256 h;
    Address a;
    EXPECT_TRUE(h.IsNull());
    EXPECT_TRUE(a.IsNull());
    EXPECT_EQ(Hash256::SIZE, 32u);
    EXPECT_EQ(Address::SIZE, 20u);
}

TEST(TypesTest, HexIsStorageOrder) {
    Address a = Address::FromHex("0x0102030405060708090a0b0c0d0e0f1011121314");
    EXPECT_EQ(a[0], 0x01);
    EXPECT_EQ(a[19], 0x14);
    EXPECT_EQ(a.ToHex(), "0102030405060708090a0b0c0d0e0f1011121314");
    EXPECT_EQ(ShortAddress(a), "0x01020304...");
}

TEST(TypesTest, FromHexRejectsWrongLength) {
    EXPECT_THROW(Address::FromHex("0x0102"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex("zz"), std::invalid_argument);
}

TEST(TypesTest, MakeAddressFillsEveryByte) {
    Address a = MakeAddress(0xAB);
    for (auto b : a) {
        EXPECT_EQ(b, 0xAB);
    }
    EXPECT_NE(MakeAddress(1), MakeAddress(2));
    EXPECT_TRUE(MakeAddress(1) < MakeAddress(2));
}

TEST(HexTest, RoundTripAndValidation) {
    std::vector<uint8_t> bytes = {0x00, 0xff, 0x10};
    EXPECT_EQ(BytesToHex(bytes), "00ff10");
    EXPECT_EQ(HexToBytes("0x00FF10"), bytes);
    EXPECT_TRUE(IsValidHex("00ff10"));
    EXPECT_FALSE(IsValidHex("0g"));
    EXPECT_EQ(StripHexPrefix("0xabcd"), "abcd");
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
}

TEST(HexTest, TryReportsOffset) {
    std::vector<uint8_t> out = {0x99};
    size_t pos = 0;
    EXPECT_FALSE(TryHexToBytes("0x12z4", out, &pos));
    EXPECT_EQ(pos, 4u);
    EXPECT_EQ(out, std::vector<uint8_t>{0x99});

    EXPECT_TRUE(TryHexToBytes("0X", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(IsValidHex("0x"));
}

// ============================================================================
// Serialization
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << uint32_t{0x01020304};
    ASSERT_EQ(ss.size(), 4u);
    EXPECT_EQ(ss.data()[0], 0x04);
    EXPECT_EQ(ss.data()[3], 0x01);
}

TEST(SerializeTest, SignedValuesSurvive) {
    DataStream ss;
    ss << int64_t{-42} << std::string("bond") << true;

    int64_t v = 0;
    std::string s;
    bool b = false;
    ss >> v >> s >> b;
    EXPECT_EQ(v, -42);
    EXPECT_EQ(s, "bond");
    EXPECT_TRUE(b);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, AddressListCarriesCount) {
    std::vector<Address> relayers = {MakeAddress(1), MakeAddress(2)};
    DataStream ss;
    ss << relayers;
    EXPECT_EQ(ss.size(), 1u + 2 * Address::SIZE);

    std::vector<Address> decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, relayers);
}

TEST(SerializeTest, TruncatedInputThrows) {
    DataStream ss;
    ss << uint64_t{7};
    std::vector<uint8_t> partial(ss.data(), ss.data() + 5);
    DataStream in(partial);
    uint64_t v = 0;
    EXPECT_THROW(in >> v, std::ios_base::failure);
}

TEST(SerializeTest, BoolRejectsOtherBytes) {
    std::vector<uint8_t> raw = {2};
    DataStream in(raw);
    bool b = false;
    EXPECT_THROW(in >> b, std::ios_base::failure);
}

TEST(SerializeTest, BigEndianKeysSort) {
    std::vector<uint8_t> a;
    std::vector<uint8_t> b;
    WriteBE64(a, 255);
    WriteBE64(b, 256);
    EXPECT_TRUE(a < b);
    EXPECT_EQ(ReadBE64(b.data()), 256u);
}

TEST(SerializeTest, CompactSizeBoundaries) {
    for (uint64_t n : {uint64_t{0}, uint64_t{253}, uint64_t{254}, uint64_t{70000}}) {
        DataStream ss;
        WriteCompactSize(ss, n);
        EXPECT_EQ(ReadCompactSize(ss), n);
    }
    DataStream big;
    WriteCompactSize(big, MAX_SERIALIZED_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(big), DecodeError);
}

TEST(SerializeTest, CompactSizeRejectsLongForms) {
    std::vector<uint8_t> padded = {0xFE, 0x05, 0x00, 0x00, 0x00};
    DataStream in(padded);
    EXPECT_THROW(ReadCompactSize(in), DecodeError);

    std::vector<uint8_t> sixteenBit = {0xFD, 0x00, 0x01};
    DataStream in16(sixteenBit);
    EXPECT_THROW(ReadCompactSize(in16), DecodeError);
}

TEST(SerializeTest, NarrowSignedIntegers) {
    DataStream ss;
    ss << int32_t{-2} << uint8_t{0xAB};
    EXPECT_EQ(ss.size(), 5u);
    EXPECT_EQ(ss.data()[0], 0xFE);
    EXPECT_EQ(ss.data()[3], 0xFF);

    int32_t v = 0;
    uint8_t b = 0;
    ss >> v >> b;
    EXPECT_EQ(v, -2);
    EXPECT_EQ(b, 0xAB);
}

TEST(SerializeTest, VectorCountBeyondInputRejected) {
    std::vector<uint8_t> raw = {0x03, 0x01};
    DataStream in(raw);
    std::vector<Address> decoded;
    EXPECT_THROW(in >> decoded, DecodeError);
}

TEST(TypesTest, StreamsAsPrefixedHex) {
    std::ostringstream os;
    os << MakeAddress(0x0F);
    EXPECT_EQ(os.str(), "0x" + MakeAddress(0x0F).ToHex());
    EXPECT_EQ(os.str().substr(0, 6), "0x0f0f");
}

} // namespace test
} // namespace bondvault
