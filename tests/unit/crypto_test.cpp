// tests/unit/crypto_test.cpp
#include <gtest/gtest.h>
#include "common/crypto/include/Keccak256.hpp"
#include "common/crypto/include/HexUtils.hpp"
#include <stdexcept>

using namespace multisig_engine::crypto;

// ========== Keccak-256 ==========

TEST(Keccak256Test, EmptyInput) {
    EXPECT_EQ(ToHex(Keccak256::Hash(std::string())),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, ShortAscii) {
    EXPECT_EQ(ToHex(Keccak256::Hash(std::string("abc"))),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, Sentence) {
    EXPECT_EQ(ToHex(Keccak256::Hash(std::string("The quick brown fox jumps over the lazy dog"))),
              "4d741b6f1eb29cb2a9b9911c82f56fa8d73b04959d3d9d222895df6c0b28aa15");
}

TEST(Keccak256Test, FunctionSelectorPrefix) {
    Hash256 hash = Keccak256::Hash(std::string("transfer(address,uint256)"));
    EXPECT_EQ(ToHex(hash.data(), 4), "a9059cbb");
}

TEST(Keccak256Test, IncrementalMatchesOneShot) {
    // rate(136바이트) 경계를 넘는 입력
    Bytes input(300);
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<uint8_t>(i * 7);
    }

    Keccak256 hasher;
    hasher.Update(input.data(), 1);
    hasher.Update(input.data() + 1, 135);
    hasher.Update(input.data() + 136, 100);
    hasher.Update(input.data() + 236, 64);

    EXPECT_EQ(hasher.Finalize(), Keccak256::Hash(input));
}

TEST(Keccak256Test, ExactRateBlock) {
    Bytes block(136, 0x61);
    Keccak256 hasher;
    hasher.Update(block);
    EXPECT_EQ(hasher.Finalize(), Keccak256::Hash(std::string(136, 'a')));
}

TEST(Keccak256Test, FinalizeStartsFreshInput) {
    Keccak256 hasher;
    hasher.Update(std::string("abc"));
    hasher.Finalize();

    hasher.Update(std::string("abc"));
    EXPECT_EQ(ToHex(hasher.Finalize()),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
    EXPECT_EQ(hasher.Finalize(), Keccak256::Hash(std::string()));
}

// ========== Hex ==========

TEST(HexUtilsTest, EncodesLowercase) {
    Bytes data{0x00, 0xAB, 0xff, 0x10};
    EXPECT_EQ(ToHex(data), "00abff10");
    EXPECT_EQ(ToHex(data, true), "0x00abff10");
}

TEST(HexUtilsTest, DecodesWithAndWithoutPrefix) {
    Bytes expected{0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(FromHex("deadbeef"), expected);
    EXPECT_EQ(FromHex("0xDEADBEEF"), expected);
    EXPECT_TRUE(FromHex("0x").empty());
}

TEST(HexUtilsTest, RejectsMalformed) {
    EXPECT_THROW(FromHex("0xabc"), std::invalid_argument);
    EXPECT_THROW(FromHex("zz"), std::invalid_argument);

    Bytes out{0x01};
    EXPECT_FALSE(TryFromHex("0x1g", out));
}

TEST(HexUtilsTest, PrefixHelpers) {
    EXPECT_TRUE(Has0xPrefix("0x12"));
    EXPECT_TRUE(Has0xPrefix("0X12"));
    EXPECT_FALSE(Has0xPrefix("12"));
    EXPECT_EQ(Strip0x("0xabcd"), "abcd");
    EXPECT_EQ(Strip0x("abcd"), "abcd");
    EXPECT_TRUE(IsHexString("0x0123456789abcdefABCDEF"));
    EXPECT_FALSE(IsHexString("0x12 3"));
    EXPECT_EQ(HexDigitValue('f'), 15);
    EXPECT_EQ(HexDigitValue('A'), 10);
    EXPECT_EQ(HexDigitValue('x'), -1);
}
