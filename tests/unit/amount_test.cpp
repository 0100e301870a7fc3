// tests/unit/amount_test.cpp
#include <gtest/gtest.h>
#include "multisig/model/include/Amount.hpp"
#include "multisig/errors/include/MultiSigException.hpp"

using namespace multisig_engine::multisig;

TEST(AmountTest, ParsesWholeAndFractionalEther) {
    EXPECT_EQ(ToDecimalString(ParseAmount("1")), "1000000000000000000");
    EXPECT_EQ(ToDecimalString(ParseAmount("1.5")), "1500000000000000000");
    EXPECT_EQ(ToDecimalString(ParseAmount("0.000000000000000001")), "1");
    EXPECT_EQ(ToDecimalString(ParseAmount(".25")), "250000000000000000");
    EXPECT_EQ(ToDecimalString(ParseAmount("2.")), "2000000000000000000");
}

TEST(AmountTest, ZeroIsAllowed) {
    EXPECT_EQ(ParseAmount("0"), 0);
    EXPECT_EQ(ParseAmount("0.0"), 0);
}

TEST(AmountTest, CustomDecimals) {
    EXPECT_EQ(ToDecimalString(ParseAmount("12.34", 6)), "12340000");
    EXPECT_EQ(ToDecimalString(ParseAmount("7", 0)), "7");
}

TEST(AmountTest, TrimsSurroundingWhitespace) {
    EXPECT_EQ(ToDecimalString(ParseAmount("  3 \n")), "3000000000000000000");
}

TEST(AmountTest, RejectsMalformed) {
    EXPECT_THROW(ParseAmount(""), InvalidAmountException);
    EXPECT_THROW(ParseAmount("   "), InvalidAmountException);
    EXPECT_THROW(ParseAmount("."), InvalidAmountException);
    EXPECT_THROW(ParseAmount("-1"), InvalidAmountException);
    EXPECT_THROW(ParseAmount("1e18"), InvalidAmountException);
    EXPECT_THROW(ParseAmount("1.2.3"), InvalidAmountException);
    EXPECT_THROW(ParseAmount("0x10"), InvalidAmountException);
}

TEST(AmountTest, RejectsTooManyFractionDigits) {
    EXPECT_THROW(ParseAmount("0.0000000000000000001"), InvalidAmountException);
    EXPECT_THROW(ParseAmount("1.5", 0), InvalidAmountException);
}

TEST(AmountTest, RejectsOverflow) {
    // 2^256 wei
    const std::string too_big =
        "115792089237316195423570985008687907853269984665640564039457584007913129639936";
    EXPECT_THROW(ParseAmount(too_big, 0), InvalidAmountException);
    EXPECT_TRUE(IsValidAmount(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935", 0));
}

TEST(AmountTest, IsValidAmount) {
    EXPECT_TRUE(IsValidAmount("10.25"));
    EXPECT_FALSE(IsValidAmount("ten"));
}
