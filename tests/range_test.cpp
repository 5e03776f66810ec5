#include <gtest/gtest.h>

#include "lostore/bindings/range.hpp"

using namespace lostore::core;
using namespace lostore::bindings::http;

namespace {

// Parses and resolves in one go; fails the test on a parse error.
Status resolve(const char* header, i64 size, ByteRange* out) {
    ByteRangeSpec spec{};
    Status s = parse_byte_range(header, &spec);
    EXPECT_TRUE(is_ok(s)) << header;
    if (!is_ok(s)) return s;
    return resolve_byte_range(spec, size, out);
}

} // namespace

//=============================================================================
// Parsing
//=============================================================================

TEST(ByteRangeParse, StartAndEnd) {
    ByteRangeSpec spec{};
    ASSERT_TRUE(is_ok(parse_byte_range("bytes=2-5", &spec)));
    EXPECT_EQ(spec.first, 2);
    EXPECT_TRUE(spec.has_last);
    EXPECT_EQ(spec.last, 5);
    EXPECT_FALSE(spec.suffix);
}

TEST(ByteRangeParse, OpenEndedAndSuffix) {
    ByteRangeSpec spec{};
    ASSERT_TRUE(is_ok(parse_byte_range("bytes=7-", &spec)));
    EXPECT_EQ(spec.first, 7);
    EXPECT_FALSE(spec.has_last);

    ASSERT_TRUE(is_ok(parse_byte_range("  bytes= -3 ", &spec)));
    EXPECT_TRUE(spec.suffix);
    EXPECT_EQ(spec.first, 3);
}

TEST(ByteRangeParse, RejectsUnsupportedForms) {
    const char* bad[] = {
        "", "bytes", "bytes=", "bytes=-", "bytes=abc", "bytes=1-x", "items=0-1",
        "Bytes=0-1", "bytes=0-1,5-6", "bytes=5", "bytes=--3",
    };
    for (const char* h : bad) {
        ByteRangeSpec spec{};
        EXPECT_EQ(parse_byte_range(h, &spec).code, StatusCode::Invalid) << h;
    }
}

//=============================================================================
// Resolution
//=============================================================================

TEST(ByteRangeResolve, WithinObject) {
    ByteRange r{};
    ASSERT_TRUE(is_ok(resolve("bytes=2-5", 10, &r)));
    EXPECT_EQ(r.start, 2);
    EXPECT_EQ(r.end, 5);
    EXPECT_EQ(r.length(), 4);
}

TEST(ByteRangeResolve, EndIsClamped) {
    ByteRange r{};
    ASSERT_TRUE(is_ok(resolve("bytes=8-20", 10, &r)));
    EXPECT_EQ(r.start, 8);
    EXPECT_EQ(r.end, 9);
}

TEST(ByteRangeResolve, Suffix) {
    ByteRange r{};
    ASSERT_TRUE(is_ok(resolve("bytes=-3", 10, &r)));
    EXPECT_EQ(r.start, 7);
    EXPECT_EQ(r.end, 9);

    ASSERT_TRUE(is_ok(resolve("bytes=-50", 10, &r)));
    EXPECT_EQ(r.start, 0);
    EXPECT_EQ(r.end, 9);
}

TEST(ByteRangeResolve, OpenEnded) {
    ByteRange r{};
    ASSERT_TRUE(is_ok(resolve("bytes=4-", 10, &r)));
    EXPECT_EQ(r.start, 4);
    EXPECT_EQ(r.end, 9);
}

TEST(ByteRangeResolve, Unsatisfiable) {
    ByteRange r{};
    EXPECT_EQ(resolve("bytes=20-30", 10, &r).code, StatusCode::RangeNotSatisfiable);
    EXPECT_EQ(resolve("bytes=10-", 10, &r).code, StatusCode::RangeNotSatisfiable);
    EXPECT_EQ(resolve("bytes=5-2", 10, &r).code, StatusCode::RangeNotSatisfiable);
    EXPECT_EQ(resolve("bytes=-0", 10, &r).code, StatusCode::RangeNotSatisfiable);
    EXPECT_EQ(resolve("bytes=0-", 0, &r).code, StatusCode::RangeNotSatisfiable);
}

TEST(ByteRangeResolve, SingleByte) {
    ByteRange r{};
    ASSERT_TRUE(is_ok(resolve("bytes=9-9", 10, &r)));
    EXPECT_EQ(r.length(), 1);
}

//=============================================================================
// Headers
//=============================================================================

TEST(ByteRangeHeaders, ContentRange) {
    EXPECT_EQ(content_range(ByteRange{2, 5}, 10), "bytes 2-5/10");
    EXPECT_EQ(content_range_unsatisfied(10), "bytes */10");
}
