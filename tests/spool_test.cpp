#include <gtest/gtest.h>
#include <string>

#include "lostore/bindings/spool.hpp"

using namespace lostore::core;
using namespace lostore::bindings::http;

namespace {

Status write_str(SpoolBuffer& b, const std::string& s) {
    return b.write(reinterpret_cast<const u8*>(s.data()), s.size());
}

std::string drain(SpoolBuffer& b, u64 step) {
    std::string out;
    Bytes chunk;
    while (true) {
        EXPECT_TRUE(is_ok(b.read(step, &chunk)));
        if (chunk.empty()) break;
        out.append(chunk.begin(), chunk.end());
    }
    return out;
}

} // namespace

TEST(SpoolBuffer, StaysInMemoryBelowThreshold) {
    SpoolBuffer b(16);
    ASSERT_TRUE(is_ok(write_str(b, "hello")));
    ASSERT_TRUE(is_ok(write_str(b, " world")));
    EXPECT_FALSE(b.spilled());
    EXPECT_EQ(b.size(), 11u);

    ASSERT_TRUE(is_ok(b.rewind()));
    EXPECT_EQ(drain(b, 4), "hello world");
}

TEST(SpoolBuffer, SpillsToFile) {
    SpoolBuffer b(8);
    ASSERT_TRUE(is_ok(write_str(b, "12345")));
    EXPECT_FALSE(b.spilled());
    ASSERT_TRUE(is_ok(write_str(b, "67890")));
    EXPECT_TRUE(b.spilled());
    ASSERT_TRUE(is_ok(write_str(b, "abc")));
    EXPECT_EQ(b.size(), 13u);

    ASSERT_TRUE(is_ok(b.rewind()));
    EXPECT_EQ(drain(b, 3), "1234567890abc");
}

TEST(SpoolBuffer, ReadAllAndRewind) {
    SpoolBuffer b(4);
    const std::string big(100000, 'k');
    ASSERT_TRUE(is_ok(write_str(b, big)));
    ASSERT_TRUE(is_ok(b.rewind()));

    Bytes all;
    ASSERT_TRUE(is_ok(b.read_all(&all)));
    EXPECT_EQ(all.size(), big.size());
    ASSERT_TRUE(is_ok(b.read_all(&all)));
    EXPECT_TRUE(all.empty());

    ASSERT_TRUE(is_ok(b.rewind()));
    Bytes head;
    ASSERT_TRUE(is_ok(b.read(2, &head)));
    EXPECT_EQ(head, (Bytes{'k', 'k'}));
}

TEST(SpoolBuffer, EmptyAndInvalid) {
    SpoolBuffer b;
    ASSERT_TRUE(is_ok(b.write(nullptr, 0)));
    EXPECT_EQ(b.write(nullptr, 3).code, StatusCode::Invalid);
    EXPECT_EQ(b.size(), 0u);
    Bytes out{'x'};
    ASSERT_TRUE(is_ok(b.read(10, &out)));
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(b.read(1, nullptr).code, StatusCode::Invalid);
}
