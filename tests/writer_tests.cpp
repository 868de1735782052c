#include "binstream/writer.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace binstream;

static Bytes finish(BufferWriter& w) {
    return w.to_vec().value();
}

TEST(BufferWriter, EmptyStream) {
    BufferWriter w;
    EXPECT_EQ(w.position().value(), 0u);
    EXPECT_EQ(w.len().value(), 0u);
    EXPECT_TRUE(finish(w).empty());
}

TEST(BufferWriter, FixedWidthLayout) {
    BufferWriter w;
    EXPECT_EQ(w.write_u8(0x01).value(), 1u);
    EXPECT_EQ(w.write_u16(0x1234).value(), 2u);
    EXPECT_EQ(w.write_u32(0x12345678).value(), 4u);
    EXPECT_EQ(w.write_i32(-0x12345678).value(), 4u);
    EXPECT_EQ(w.write_u64(0x0123456789ABCDEFull).value(), 8u);

    EXPECT_EQ(test_support::hex(finish(w)),
        "01 34 12 78 56 34 12 88 a9 cb ed ef cd ab 89 67 45 23 01");
}

TEST(BufferWriter, SupplementalWidths) {
    BufferWriter w;
    EXPECT_EQ(w.write_i16(-2).value(), 2u);
    EXPECT_EQ(w.write_i64(-1).value(), 8u);
    EXPECT_EQ(w.write_f32(1.0f).value(), 4u);
    EXPECT_EQ(w.write_f64(1.0).value(), 8u);

    EXPECT_EQ(test_support::hex(finish(w)),
        "fe ff ff ff ff ff ff ff ff ff 00 00 80 3f 00 00 00 00 00 00 f0 3f");
}

TEST(BufferWriter, CursorAdvances) {
    BufferWriter w;
    ASSERT_TRUE(w.write_u32(9001));
    EXPECT_EQ(w.position().value(), 4u);
    ASSERT_TRUE(w.write_u8(7));
    EXPECT_EQ(w.position().value(), 5u);
    EXPECT_EQ(w.len().value(), 5u);
}

TEST(BufferWriter, SeekAndPatch) {
    BufferWriter w;
    ASSERT_TRUE(w.write_u32(9001));
    ASSERT_TRUE(w.write_u32(9002));

    EXPECT_EQ(w.seek(0, SeekOrigin::Begin).value(), 0u);
    ASSERT_TRUE(w.write_u32(9003));
    EXPECT_EQ(w.position().value(), 4u);
    EXPECT_EQ(w.len().value(), 8u);

    EXPECT_EQ(test_support::hex(finish(w)), "2b 23 00 00 2a 23 00 00");
}

TEST(BufferWriter, SeekOrigins) {
    BufferWriter w;
    ASSERT_TRUE(w.write_bytes({ 1, 2, 3, 4, 5, 6 }));

    EXPECT_EQ(w.seek(-2, SeekOrigin::End).value(), 4u);
    EXPECT_EQ(w.seek(-1, SeekOrigin::Current).value(), 3u);
    EXPECT_EQ(w.seek(2, SeekOrigin::Current).value(), 5u);
    EXPECT_EQ(w.seek(1, SeekOrigin::Begin).value(), 1u);
}

TEST(BufferWriter, LenRestoresPosition) {
    BufferWriter w;
    ASSERT_TRUE(w.write_bytes({ 1, 2, 3, 4 }));
    ASSERT_TRUE(w.seek(1, SeekOrigin::Begin));

    EXPECT_EQ(w.len().value(), 4u);
    EXPECT_EQ(w.position().value(), 1u);
}

TEST(BufferWriter, NegativeSeekIsRejected) {
    BufferWriter w;
    ASSERT_TRUE(w.write_u32(1));

    auto r = w.seek(-1, SeekOrigin::Begin);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), BufferError(IndexOutOfRange{ -1 }));

    // The stream stays usable.
    EXPECT_EQ(w.position().value(), 4u);
    EXPECT_TRUE(w.write_u8(2));
}

TEST(BufferWriter, SeekPastEndOfMemoryIsRejected) {
    BufferWriter w;
    ASSERT_TRUE(w.write_u32(1));

    auto r = w.seek(10, SeekOrigin::Begin);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), BufferError(IndexOutOfRange{ 10 }));
    EXPECT_EQ(w.position().value(), 4u);
}

TEST(BufferWriter, ToVecIgnoresCursor) {
    BufferWriter w;
    ASSERT_TRUE(w.write_bytes({ 0xAA, 0xBB, 0xCC }));
    ASSERT_TRUE(w.seek(1, SeekOrigin::Begin));

    EXPECT_EQ(finish(w), (Bytes{ 0xAA, 0xBB, 0xCC }));
    EXPECT_EQ(w.position().value(), 3u);
}

TEST(BufferWriter, SevenBitIntEncodings) {
    struct Case {
        int32_t value;
        const char* hex;
    };
    const Case cases[] = {
        { 0, "00" },
        { 1, "01" },
        { 127, "7f" },
        { 128, "80 01" },
        { 300, "ac 02" },
        { 16383, "ff 7f" },
        { 16384, "80 80 01" },
        { 0x7FFFFFFF, "ff ff ff ff 07" },
        { -1, "ff ff ff ff 0f" },
    };

    for (const auto& c : cases) {
        BufferWriter w;
        auto written = w.write_7bit_int(c.value);
        ASSERT_TRUE(written.has_value()) << c.value;
        Bytes data = finish(w);
        EXPECT_EQ(test_support::hex(data), c.hex) << c.value;
        EXPECT_EQ(written.value(), data.size()) << c.value;
    }
}

TEST(BufferWriter, StringIsLengthPrefixed) {
    BufferWriter w;
    EXPECT_EQ(w.write_string("Hi").value(), 3u);
    EXPECT_EQ(test_support::hex(finish(w)), "02 48 69");
}

TEST(BufferWriter, EmptyStringIsSingleZeroByte) {
    BufferWriter w;
    EXPECT_EQ(w.write_string("").value(), 1u);
    EXPECT_EQ(finish(w), (Bytes{ 0x00 }));
}

TEST(BufferWriter, StringLengthCountsUtf8Bytes) {
    BufferWriter w;
    // "é€" is 2 code points, 5 bytes.
    ASSERT_TRUE(w.write_string("\xC3\xA9\xE2\x82\xAC"));
    EXPECT_EQ(test_support::hex(finish(w)), "05 c3 a9 e2 82 ac");
}

TEST(BufferWriter, LongStringUsesMultiByteLength) {
    BufferWriter w;
    std::string s(200, 'x');
    EXPECT_EQ(w.write_string(s).value(), 202u);

    Bytes data = finish(w);
    ASSERT_EQ(data.size(), 202u);
    EXPECT_EQ(data[0], 0xC8);
    EXPECT_EQ(data[1], 0x01);
}

TEST(BufferWriter, InvalidUtf8StringIsRejected) {
    BufferWriter w;
    auto r = w.write_string(std::string("\xC0\x80", 2));
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(failed_with<IOFailure>(r));
    EXPECT_EQ(w.len().value(), 0u);
}

TEST(BufferWriter, BytesHaveNoPrefix) {
    BufferWriter w;
    EXPECT_EQ(w.write_bytes({ 0xDE, 0xAD, 0xBE, 0xEF }).value(), 4u);
    EXPECT_EQ(w.write_bytes({}).value(), 0u);
    EXPECT_EQ(test_support::hex(finish(w)), "de ad be ef");
}

TEST(BufferWriter, WriteFailureIsIOFailure) {
    BufferWriter w(std::make_unique<test_support::FixedCapacityStream>(3));
    EXPECT_EQ(w.write_u16(0xFFFF).value(), 2u);

    auto r = w.write_u32(1);
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(failed_with<IOFailure>(r));
}

TEST(BufferWriter, VarintWriteFailurePropagates) {
    BufferWriter w(std::make_unique<test_support::FixedCapacityStream>(1));
    auto r = w.write_7bit_int(300);
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(failed_with<IOFailure>(r));
}

TEST(BufferWriter, ReleaseReturnsStream) {
    BufferWriter w;
    ASSERT_TRUE(w.write_u8(0x42));

    std::unique_ptr<std::iostream> s = w.release();
    ASSERT_NE(s.get(), nullptr);
    s->seekg(0, std::ios::beg);
    EXPECT_EQ(s->get(), 0x42);
}

TEST(BufferWriter, NullStreamIsRejected) {
    EXPECT_THROW(BufferWriter{ std::unique_ptr<std::iostream>() }, std::invalid_argument);
}
