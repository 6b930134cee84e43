/**
 * @file CodecTest.cpp
 * @brief Unit tests for whole-file decode/encode
 */

#include <gtest/gtest.h>
#include <string>

#include "fixtures/TestSchemas.hpp"

using namespace FwFile;
using namespace FwFileTest;

class CodecTest : public ::testing::Test {
  protected:
    void SetUp() override {
        schema_ = workedExampleSchema();
        ASSERT_FALSE(schema_->empty()) << schema_->validationError();
    }

    std::shared_ptr<const Schema> schema_;
};

TEST_F(CodecTest, DecodesRecordsInOrder) {
    Codec codec(schema_);
    FixedWidthFile file;
    std::error_code ec;

    ASSERT_TRUE(codec.decode(exampleFileBytes(), file, ec)) << codec.lastError();
    ASSERT_EQ(file.records().size(), 4u);
    EXPECT_EQ(file.records()[0].typeTag, "HEADER");
    EXPECT_EQ(file.records()[3].typeTag, "TRANSACTION");
    EXPECT_EQ(file.count("TRANSACTION"), 3u);
    EXPECT_TRUE(file.finalTerminator());
}

TEST_F(CodecTest, RoundTripIsByteExact) {
    Codec codec(schema_);
    std::string bytes = exampleFileBytes();
    FixedWidthFile file;
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(codec.decode(bytes, file, ec));
    ASSERT_TRUE(codec.encode(file, out, ec));
    EXPECT_EQ(out, bytes);
}

TEST_F(CodecTest, MissingFinalTerminatorPreserved) {
    Codec codec(schema_);
    std::string bytes = exampleFileBytes();
    bytes.pop_back();
    FixedWidthFile file;
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(codec.decode(bytes, file, ec));
    EXPECT_FALSE(file.finalTerminator());
    EXPECT_EQ(file.records().size(), 4u);
    ASSERT_TRUE(codec.encode(file, out, ec));
    EXPECT_EQ(out, bytes);
}

TEST_F(CodecTest, CrLfRoundTrip) {
    Codec codec(schema_, LineTerminator::CrLf);
    std::string bytes = exampleHeader("ACME", "x") + "\r\n" + exampleTxn("1", "USD", "1") + "\r\n";
    FixedWidthFile file;
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(codec.decode(bytes, file, ec)) << codec.lastError();
    ASSERT_EQ(file.records().size(), 2u);
    ASSERT_TRUE(codec.encode(file, out, ec));
    EXPECT_EQ(out, bytes);
}

TEST_F(CodecTest, CrLfFileWithLfCodecIsMalformed) {
    Codec codec(schema_);
    std::string bytes = exampleHeader("ACME", "x") + "\r\n";
    FixedWidthFile file;
    std::error_code ec;

    EXPECT_FALSE(codec.decode(bytes, file, ec));
    EXPECT_EQ(ec, Errc::MalformedRecord);
    EXPECT_EQ(codec.errorLine(), 1u);
}

TEST_F(CodecTest, EmptyInputDecodesToNoRecords) {
    Codec codec(schema_);
    FixedWidthFile file;
    std::string out = "junk";
    std::error_code ec;

    ASSERT_TRUE(codec.decode("", file, ec));
    EXPECT_TRUE(file.records().empty());
    ASSERT_TRUE(codec.encode(file, out, ec));
    EXPECT_EQ(out, "");
}

TEST_F(CodecTest, UnknownWidthReportsLine) {
    Codec codec(schema_);
    std::string bytes = exampleHeader("ACME", "x") + "\n" + "too short\n";
    FixedWidthFile file;
    std::error_code ec;

    EXPECT_FALSE(codec.decode(bytes, file, ec));
    EXPECT_EQ(ec, Errc::MalformedRecord);
    EXPECT_EQ(codec.errorLine(), 2u);
    EXPECT_NE(codec.lastError().find("line 2"), std::string::npos);
    EXPECT_NE(codec.lastError().find("length 9"), std::string::npos);
}

TEST_F(CodecTest, UnknownTagReportsLine) {
    Codec codec(schema_);
    std::string txn = exampleTxn("1", "USD", "1");
    txn.back() = 'Z';
    FixedWidthFile file;
    std::error_code ec;

    EXPECT_FALSE(codec.decode(txn + "\n", file, ec));
    EXPECT_EQ(ec, Errc::MalformedRecord);
    EXPECT_NE(codec.lastError().find("tag bytes"), std::string::npos);
}

TEST_F(CodecTest, FailedDecodeLeavesOutputUntouched) {
    Codec codec(schema_);
    FixedWidthFile file;
    std::error_code ec;
    ASSERT_TRUE(codec.decode(exampleFileBytes(), file, ec));

    EXPECT_FALSE(codec.decode("broken\n", file, ec));
    EXPECT_EQ(file.records().size(), 4u);
}

TEST_F(CodecTest, EncodeRejectsWrongRecordSize) {
    Codec codec(schema_);
    FixedWidthFile file;
    std::string out = "keep";
    std::error_code ec;
    ASSERT_TRUE(codec.decode(exampleFileBytes(), file, ec));

    file.records()[2].raw += "X";
    EXPECT_FALSE(codec.encode(file, out, ec));
    EXPECT_EQ(ec, Errc::MalformedRecord);
    EXPECT_EQ(codec.errorLine(), 3u);
    EXPECT_EQ(out, "keep");
}

TEST_F(CodecTest, DecodeOfEncodeIsStable) {
    Codec codec(schema_);
    FixedWidthFile first;
    FixedWidthFile second;
    std::string out;
    std::error_code ec;

    ASSERT_TRUE(codec.decode(exampleFileBytes(), first, ec));
    ASSERT_TRUE(codec.encode(first, out, ec));
    ASSERT_TRUE(codec.decode(out, second, ec));
    ASSERT_EQ(first.records().size(), second.records().size());
    for (size_t i = 0; i < first.records().size(); ++i) {
        EXPECT_EQ(first.records()[i].typeTag, second.records()[i].typeTag);
        EXPECT_EQ(first.records()[i].raw, second.records()[i].raw);
    }
}
