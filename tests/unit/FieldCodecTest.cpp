/**
 * @file FieldCodecTest.cpp
 * @brief Unit tests for field padding, numeric and decimal conventions
 */

#include <gtest/gtest.h>
#include <string>

#include <fwfile/Errors.hpp>
#include <fwfile/codec/FieldCodec.hpp>

using namespace FwFile;

// =============================================================================
// Decimal Tests
// =============================================================================

TEST(DecimalTest, ParsePadsFractionToScale) {
    Decimal d;
    std::error_code ec;
    ASSERT_TRUE(Decimal::parse("12.5", 2, d, ec));
    EXPECT_EQ(d.units, "1250");
    EXPECT_EQ(d.toString(), "12.50");
    EXPECT_EQ(d.toImpliedString(), "1250");
}

TEST(DecimalTest, ParseWithoutPoint) {
    Decimal d;
    std::error_code ec;
    ASSERT_TRUE(Decimal::parse("500", 2, d, ec));
    EXPECT_EQ(d.toString(), "500.00");
}

TEST(DecimalTest, ExtraZeroFractionAccepted) {
    Decimal d;
    std::error_code ec;
    ASSERT_TRUE(Decimal::parse("1.2300", 2, d, ec));
    EXPECT_EQ(d.toString(), "1.23");
}

TEST(DecimalTest, LostPrecisionRejected) {
    Decimal d;
    std::error_code ec;
    EXPECT_FALSE(Decimal::parse("1.234", 2, d, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

TEST(DecimalTest, GarbageRejected) {
    Decimal d;
    std::error_code ec;
    EXPECT_FALSE(Decimal::parse("12a", 0, d, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
    EXPECT_FALSE(Decimal::parse(".", 2, d, ec));
    EXPECT_FALSE(Decimal::parse("", 2, d, ec));
}

TEST(DecimalTest, NegativeZeroNormalized) {
    Decimal d;
    std::error_code ec;
    ASSERT_TRUE(Decimal::parse("-0.00", 2, d, ec));
    EXPECT_FALSE(d.negative);
    EXPECT_EQ(d.toString(), "0.00");
}

TEST(DecimalTest, UnitsRoundTrip) {
    Decimal d = Decimal::fromUnits(-1205, 2);
    EXPECT_EQ(d.toString(), "-12.05");

    int64_t units = 0;
    std::error_code ec;
    ASSERT_TRUE(d.toUnits(units, ec));
    EXPECT_EQ(units, -1205);

    EXPECT_EQ(Decimal::fromUnits(5, 2).toString(), "0.05");
}

TEST(DecimalTest, ToUnitsOverflow) {
    Decimal d;
    std::error_code ec;
    ASSERT_TRUE(Decimal::parse("99999999999999999999", 0, d, ec));
    int64_t units = 0;
    EXPECT_FALSE(d.toUnits(units, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

// =============================================================================
// Text field Tests
// =============================================================================

TEST(FieldCodecTextTest, LeftJustifiedPadsRight) {
    auto spec = FieldSpec::text("name", 0, 8);
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "ACME", out, ec));
    EXPECT_EQ(out, "ACME    ");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "ACME");
}

TEST(FieldCodecTextTest, RightJustifiedPadsLeft) {
    auto spec = FieldSpec::text("code", 0, 5);
    spec.justify = Justify::Right;
    spec.padChar = '*';
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "AB", out, ec));
    EXPECT_EQ(out, "***AB");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "AB");
}

TEST(FieldCodecTextTest, ExactWidthFits) {
    auto spec = FieldSpec::text("c", 0, 3);
    std::string out;
    std::error_code ec;
    ASSERT_TRUE(encodeField(spec, "USD", out, ec));
    EXPECT_EQ(out, "USD");
}

TEST(FieldCodecTextTest, TooLongRejectedAndOutputUntouched) {
    auto spec = FieldSpec::text("c", 0, 3);
    std::string out = "keep";
    std::error_code ec;
    EXPECT_FALSE(encodeField(spec, "USDX", out, ec));
    EXPECT_EQ(ec, Errc::ValueTooLong);
    EXPECT_EQ(out, "keep");
}

TEST(FieldCodecTextTest, AllowedValuesEnforced) {
    auto spec = FieldSpec::text("currency", 0, 3);
    spec.allowedValues = {"USD", "EUR", "GBP"};
    std::string out;
    std::error_code ec;

    EXPECT_TRUE(encodeField(spec, "EUR", out, ec));
    EXPECT_FALSE(encodeField(spec, "JPY", out, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

TEST(FieldCodecTextTest, LineBreakRejected) {
    auto spec = FieldSpec::text("name", 0, 10);
    std::string out;
    std::error_code ec;
    EXPECT_FALSE(encodeField(spec, "a\nb", out, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

// =============================================================================
// Numeric field Tests
// =============================================================================

TEST(FieldCodecNumericTest, ZeroPadded) {
    auto spec = FieldSpec::numeric("counter", 0, 6);
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "4", out, ec));
    EXPECT_EQ(out, "000004");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "4");
}

TEST(FieldCodecNumericTest, NegativeSignFirst) {
    auto spec = FieldSpec::numeric("n", 0, 8);
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "-42", out, ec));
    EXPECT_EQ(out, "-0000042");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "-42");
}

TEST(FieldCodecNumericTest, AllPadDecodesAsZero) {
    auto spec = FieldSpec::numeric("n", 0, 4);
    std::string back;
    std::error_code ec;

    ASSERT_TRUE(decodeField(spec, "0000", back, ec));
    EXPECT_EQ(back, "0");
    ASSERT_TRUE(decodeField(spec, "    ", back, ec));
    EXPECT_EQ(back, "0");
}

TEST(FieldCodecNumericTest, OverflowRejected) {
    auto spec = FieldSpec::numeric("n", 0, 3);
    std::string out;
    std::error_code ec;
    EXPECT_FALSE(encodeField(spec, "1000", out, ec));
    EXPECT_EQ(ec, Errc::ValueTooLong);
    EXPECT_FALSE(encodeField(spec, "-100", out, ec));
    EXPECT_EQ(ec, Errc::ValueTooLong);
}

TEST(FieldCodecNumericTest, FractionRejected) {
    auto spec = FieldSpec::numeric("n", 0, 6);
    std::string out;
    std::error_code ec;
    EXPECT_FALSE(encodeField(spec, "1.5", out, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

TEST(FieldCodecNumericTest, NonDigitBytesFailDecode) {
    auto spec = FieldSpec::numeric("n", 0, 6);
    std::string back;
    std::error_code ec;
    EXPECT_FALSE(decodeField(spec, "00x012", back, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

// =============================================================================
// Decimal field Tests
// =============================================================================

TEST(FieldCodecDecimalTest, ImpliedPoint) {
    auto spec = FieldSpec::decimal("amount", 0, 12, 2);
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "500.00", out, ec));
    EXPECT_EQ(out, "000000050000");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "500.00");
}

TEST(FieldCodecDecimalTest, ExplicitPoint) {
    auto spec = FieldSpec::decimal("amount", 0, 9, 2, false);
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "500", out, ec));
    EXPECT_EQ(out, "000500.00");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "500.00");
}

TEST(FieldCodecDecimalTest, NegativeImplied) {
    auto spec = FieldSpec::decimal("amount", 0, 8, 2);
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(encodeField(spec, "-1.5", out, ec));
    EXPECT_EQ(out, "-0000150");

    std::string back;
    ASSERT_TRUE(decodeField(spec, out, back, ec));
    EXPECT_EQ(back, "-1.50");
}

TEST(FieldCodecDecimalTest, CanonicalValueMatchesStoredForm) {
    auto spec = FieldSpec::decimal("amount", 0, 10, 2);
    std::string canonical;
    std::error_code ec;

    ASSERT_TRUE(canonicalValue(spec, "10", canonical, ec));
    EXPECT_EQ(canonical, "10.00");

    auto counter = FieldSpec::numeric("c", 0, 6);
    ASSERT_TRUE(canonicalValue(counter, "000003", canonical, ec));
    EXPECT_EQ(canonical, "3");
}
