#include <gtest/gtest.h>

#include "domain/Decimal.hpp"
#include "domain/LedgerErrors.hpp"

#include <limits>

using namespace corebank::domain;

// ============================================================================
// Разбор и форматирование
// ============================================================================

TEST(DecimalTest, Parse_FormatsWithMoneyScale) {
    EXPECT_EQ(Decimal::parse("123.45").toString(), "123.4500");
    EXPECT_EQ(Decimal::parse("-0.5").toString(), "-0.5000");
    EXPECT_EQ(Decimal::parse("  42 ").toString(), "42.0000");
    EXPECT_EQ(Decimal::parse(".25").toString(), "0.2500");
}

TEST(DecimalTest, Parse_KeepsEightFractionDigits) {
    EXPECT_EQ(Decimal::parse("190.90909091").toString(8), "190.90909091");
}

TEST(DecimalTest, Parse_RejectsMalformedInput) {
    EXPECT_THROW(Decimal::parse(""), ValidationException);
    EXPECT_THROW(Decimal::parse("abc"), ValidationException);
    EXPECT_THROW(Decimal::parse("1.2.3"), ValidationException);
    EXPECT_THROW(Decimal::parse("-"), ValidationException);
    EXPECT_THROW(Decimal::parse("1.123456789"), ValidationException);
}

TEST(DecimalTest, FromMinorUnits_MatchesParse) {
    EXPECT_EQ(Decimal::fromMinorUnits(12345, 2), Decimal::parse("123.45"));
    EXPECT_EQ(Decimal::fromInt(7), Decimal::parse("7"));
    EXPECT_EQ(Decimal::parse("123.45").toMinorUnits(2), 12345);
}

// ============================================================================
// Округление
// ============================================================================

TEST(DecimalTest, Quantize_RoundsHalfAwayFromZero) {
    EXPECT_EQ(Decimal::parse("0.00005").quantize(4).toString(), "0.0001");
    EXPECT_EQ(Decimal::parse("0.00004").quantize(4).toString(), "0.0000");
    EXPECT_EQ(Decimal::parse("-0.00005").quantize(4).toString(), "-0.0001");
    EXPECT_EQ(Decimal::parse("2.5").quantize(0).toString(0), "3");
}

TEST(DecimalTest, Divide_RoundsToEightDigits) {
    auto shares = Decimal::divide(Decimal::parse("100.00"), Decimal::parse("1.10"));
    EXPECT_EQ(shares.toString(8), "90.90909091");
}

TEST(DecimalTest, WeightedAverageCost) {
    auto shares = Decimal::parse("100") + Decimal::divide(Decimal::parse("100"), Decimal::parse("1.1"));
    auto average = Decimal::divide(Decimal::parse("200"), shares).quantize(4);
    EXPECT_EQ(average.toString(), "1.0476");
}

TEST(DecimalTest, Multiply_ScalesBack) {
    EXPECT_EQ((Decimal::parse("1000") * Decimal::parse("0.015")).toString(), "15.0000");
    EXPECT_EQ((Decimal::parse("-2.5") * Decimal::parse("4")).toString(), "-10.0000");
}

TEST(DecimalTest, Divide_ByZeroThrows) {
    EXPECT_THROW(Decimal::divide(Decimal::fromInt(1), Decimal()), ValidationException);
}

// ============================================================================
// Арифметика и сравнение
// ============================================================================

TEST(DecimalTest, ArithmeticAndComparison) {
    auto a = Decimal::parse("100.00");
    auto b = Decimal::parse("30.00");

    EXPECT_EQ((a - b).toString(), "70.0000");
    EXPECT_EQ((b - a).toString(), "-70.0000");
    EXPECT_TRUE((b - a).isNegative());
    EXPECT_EQ((b - a).abs(), a - b);
    EXPECT_TRUE(b < a);
    EXPECT_TRUE(Decimal().isZero());

    auto c = a;
    c += b;
    c -= Decimal::fromInt(30);
    EXPECT_EQ(c, a);
}

TEST(DecimalTest, Overflow_Throws) {
    auto big = Decimal::fromRaw(std::numeric_limits<int64_t>::max());
    EXPECT_THROW(big + Decimal::fromRaw(1), ValidationException);
}
