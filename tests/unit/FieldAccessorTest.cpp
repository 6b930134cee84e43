/**
 * @file FieldAccessorTest.cpp
 * @brief Unit tests for field resolution, get and set
 */

#include <gtest/gtest.h>
#include <string>

#include "fixtures/TestSchemas.hpp"

using namespace FwFile;
using namespace FwFileTest;

class FieldAccessorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        Codec codec(workedExampleSchema());
        std::error_code ec;
        ASSERT_TRUE(codec.decode(exampleFileBytes(), file_, ec)) << codec.lastError();
    }

    FixedWidthFile file_;
};

TEST_F(FieldAccessorTest, GetSingleRecordWithoutSelector) {
    FieldAccessor acc(file_);
    std::error_code ec;

    auto value = acc.get("HEADER", "address", std::nullopt, ec);
    ASSERT_TRUE(value) << acc.lastError();
    EXPECT_EQ(*value, "1 Main St");
}

TEST_F(FieldAccessorTest, SelectorComparesNumerically) {
    FieldAccessor acc(file_);
    std::error_code ec;

    auto padded = acc.get("TRANSACTION", "amount", std::string("000002"), ec);
    ASSERT_TRUE(padded) << acc.lastError();
    EXPECT_EQ(*padded, "20.00");

    auto bare = acc.get("TRANSACTION", "currency", std::string("2"), ec);
    ASSERT_TRUE(bare) << acc.lastError();
    EXPECT_EQ(*bare, "EUR");
}

TEST_F(FieldAccessorTest, AmbiguousWithoutSelector) {
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("TRANSACTION", "amount", std::nullopt, ec));
    EXPECT_EQ(ec, Errc::AmbiguousSelection);
    EXPECT_NE(acc.lastError().find("3 'TRANSACTION' records"), std::string::npos);
}

TEST_F(FieldAccessorTest, SelectorWithoutMatch) {
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("TRANSACTION", "amount", std::string("9"), ec));
    EXPECT_EQ(ec, Errc::RecordNotFound);

    EXPECT_FALSE(acc.get("TRANSACTION", "amount", std::string("abc"), ec));
    EXPECT_EQ(ec, Errc::RecordNotFound);
}

TEST_F(FieldAccessorTest, DuplicateSelectorIsAmbiguous) {
    file_.records()[3].raw.replace(13, 6, "000002");
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("TRANSACTION", "amount", std::string("2"), ec));
    EXPECT_EQ(ec, Errc::AmbiguousSelection);
}

TEST_F(FieldAccessorTest, SelectorOnTypeWithoutSelectorField) {
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("HEADER", "address", std::string("1"), ec));
    EXPECT_EQ(ec, Errc::SchemaMismatch);
}

TEST_F(FieldAccessorTest, UnknownTypeAndField) {
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("FOOTER", "total", std::nullopt, ec));
    EXPECT_EQ(ec, Errc::UnknownRecordType);

    EXPECT_FALSE(acc.get("HEADER", "zip", std::nullopt, ec));
    EXPECT_EQ(ec, Errc::UnknownField);
}

TEST_F(FieldAccessorTest, NoRecordOfType) {
    file_.records().erase(file_.records().begin());
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("HEADER", "address", std::nullopt, ec));
    EXPECT_EQ(ec, Errc::RecordNotFound);
}

TEST_F(FieldAccessorTest, SetThenGetReturnsCanonicalValue) {
    FieldAccessor acc(file_);
    std::error_code ec;

    ASSERT_TRUE(acc.set("TRANSACTION", "amount", "12.5", std::string("1"), ec)) << acc.lastError();
    auto value = acc.get("TRANSACTION", "amount", std::string("1"), ec);
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, "12.50");

    ASSERT_TRUE(acc.set("HEADER", "address", "42 Elm Rd", std::nullopt, ec));
    EXPECT_EQ(*acc.get("HEADER", "address", std::nullopt, ec), "42 Elm Rd");
}

TEST_F(FieldAccessorTest, SetTouchesOnlyFieldBytes) {
    const auto before = file_.records();
    FieldAccessor acc(file_);
    std::error_code ec;

    ASSERT_TRUE(acc.set("TRANSACTION", "currency", "GBP", std::string("2"), ec));

    const auto& after = file_.records();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        if (i != 2) {
            EXPECT_EQ(after[i].raw, before[i].raw) << "record " << i;
            continue;
        }
        ASSERT_EQ(after[i].raw.size(), before[i].raw.size());
        for (size_t b = 0; b < after[i].raw.size(); ++b) {
            if (b >= 10 && b < 13)
                continue;
            EXPECT_EQ(after[i].raw[b], before[i].raw[b]) << "byte " << b;
        }
        EXPECT_EQ(after[i].raw.substr(10, 3), "GBP");
    }
}

TEST_F(FieldAccessorTest, TooLongLeavesRecordUntouched) {
    const std::string before = file_.records()[0].raw;
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.set("HEADER", "address", std::string(21, 'x'), std::nullopt, ec));
    EXPECT_EQ(ec, Errc::ValueTooLong);
    EXPECT_EQ(file_.records()[0].raw, before);
    EXPECT_NE(acc.lastError().find("20 bytes"), std::string::npos);

    EXPECT_TRUE(acc.set("HEADER", "address", std::string(20, 'x'), std::nullopt, ec));
}

TEST_F(FieldAccessorTest, InvalidNumberLeavesRecordUntouched) {
    const std::string before = file_.records()[1].raw;
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.set("TRANSACTION", "amount", "ten", std::string("1"), ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
    EXPECT_EQ(file_.records()[1].raw, before);
}

TEST_F(FieldAccessorTest, TagFieldCannotBeSet) {
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.set("HEADER", "tag", "XX", std::nullopt, ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
}

TEST_F(FieldAccessorTest, ResolveReturnsLocation) {
    FieldAccessor acc(file_);
    FieldLocation loc;
    std::error_code ec;

    ASSERT_TRUE(acc.resolve("TRANSACTION", "currency", std::string("3"), loc, ec));
    EXPECT_EQ(loc.recordIndex, 3u);
    ASSERT_NE(loc.field, nullptr);
    EXPECT_EQ(loc.field->offset, 10u);
    EXPECT_EQ(loc.type->tag, "TRANSACTION");
}

TEST_F(FieldAccessorTest, GetAtOutOfRange) {
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.getAt(42, "amount", ec));
    EXPECT_EQ(ec, Errc::RecordNotFound);
}

TEST_F(FieldAccessorTest, CorruptNumberReportedOnGet) {
    file_.records()[1].raw.replace(0, 10, "00000x1000");
    FieldAccessor acc(file_);
    std::error_code ec;

    EXPECT_FALSE(acc.get("TRANSACTION", "amount", std::string("1"), ec));
    EXPECT_EQ(ec, Errc::InvalidValue);
    EXPECT_NE(acc.lastError().find("00000x1000"), std::string::npos);
}
