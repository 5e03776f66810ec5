#include <array>

#include <gtest/gtest.h>

#include "lostore/cli/options.hpp"

using namespace lostore::core;
using namespace lostore::cli;

namespace {

struct Parsed {
    Status status{};
    u32 consumed{0};
    ParsedOption buf[8]{};
    ParsedOptions out{buf, 0, 8};
};

template <size_t N>
void parse(const char* const (&argv)[N], Parsed* p) {
    u32 count = 0;
    const OptionSpec* specs = default_options(&count);
    p->out = ParsedOptions{p->buf, 0, 8};
    p->status = parse_options(CliArgs{argv, static_cast<u32>(N)}, specs, count, &p->out, &p->consumed);
}

} // namespace

TEST(CliOptions, LongShortAndStopAtCommand) {
    const char* const argv[] = {"--verbose", "--db", "/tmp/x.db", "-o", "out.bin", "get", "12.txt"};
    Parsed p;
    parse(argv, &p);
    ASSERT_TRUE(is_ok(p.status));
    EXPECT_EQ(p.consumed, 5u);
    ASSERT_EQ(p.out.len, 3u);

    EXPECT_EQ(p.out.data[0].id, OptionId::Verbose);
    EXPECT_EQ(p.out.data[0].value.boolv, 1);
    EXPECT_EQ(p.out.data[1].id, OptionId::Db);
    EXPECT_STREQ(p.out.data[1].value.str, "/tmp/x.db");
    EXPECT_EQ(p.out.data[2].id, OptionId::Output);
    EXPECT_STREQ(p.out.data[2].value.str, "out.bin");
}

TEST(CliOptions, EqualsAndAttachedValues) {
    const char* const argv[] = {"--range=bytes=0-9", "-r", "bytes=1-2", "-ofile", "--base-url=http://h/"};
    Parsed p;
    parse(argv, &p);
    ASSERT_TRUE(is_ok(p.status));
    EXPECT_EQ(p.consumed, 5u);
    ASSERT_EQ(p.out.len, 4u);
    EXPECT_STREQ(p.out.data[0].value.str, "bytes=0-9");
    EXPECT_STREQ(p.out.data[1].value.str, "bytes=1-2");
    EXPECT_STREQ(p.out.data[2].value.str, "file");
    EXPECT_STREQ(p.out.data[3].value.str, "http://h/");

    const ParsedOption* range = find_option(p.out, OptionId::Range);
    ASSERT_NE(range, nullptr);
    EXPECT_STREQ(range->value.str, "bytes=1-2");
    EXPECT_EQ(find_option(p.out, OptionId::Pg), nullptr);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const char* const argv[] = {"-v", "--", "--db", "x"};
    Parsed p;
    parse(argv, &p);
    ASSERT_TRUE(is_ok(p.status));
    EXPECT_EQ(p.consumed, 2u);
    EXPECT_EQ(p.out.len, 1u);
}

TEST(CliOptions, SingleDashIsPositional) {
    const char* const argv[] = {"-", "-v"};
    Parsed p;
    parse(argv, &p);
    ASSERT_TRUE(is_ok(p.status));
    EXPECT_EQ(p.consumed, 0u);
}

TEST(CliOptions, ErrorsReportTokenIndex) {
    {
        const char* const argv[] = {"-v", "--nope"};
        Parsed p;
        parse(argv, &p);
        EXPECT_EQ(p.status.code, StatusCode::Invalid);
        EXPECT_EQ(p.status.domain, StatusDomain::Cli);
        EXPECT_EQ(p.status.aux, 1u);
    }
    {
        const char* const argv[] = {"--db"};
        Parsed p;
        parse(argv, &p);
        EXPECT_EQ(p.status.code, StatusCode::Invalid);
        EXPECT_EQ(p.status.aux, 0u);
    }
    {
        const char* const argv[] = {"--verbose=yes"};
        Parsed p;
        parse(argv, &p);
        EXPECT_EQ(p.status.code, StatusCode::Invalid);
    }
    {
        const char* const argv[] = {"-vx"};
        Parsed p;
        parse(argv, &p);
        EXPECT_EQ(p.status.code, StatusCode::Invalid);
    }
}

TEST(CliOptions, I64Values) {
    const std::array<OptionSpec, 1> specs = {{
        {OptionId::None, OptionType::I64, "limit", 'n'},
    }};
    const char* argv[] = {"--limit", "42", "-n-7"};
    ParsedOption buf[4]{};
    ParsedOptions out{buf, 0, 4};
    u32 consumed = 0;
    ASSERT_TRUE(is_ok(parse_options(CliArgs{argv, 3}, specs.data(), 1, &out, &consumed)));
    ASSERT_EQ(out.len, 2u);
    EXPECT_EQ(out.data[0].value.i64v, 42);
    EXPECT_EQ(out.data[1].value.i64v, -7);

    const char* bad[] = {"--limit", "4x"};
    EXPECT_EQ(parse_options(CliArgs{bad, 2}, specs.data(), 1, &out, &consumed).code, StatusCode::Invalid);
}

TEST(CliOptions, CapacityExceeded) {
    const char* const argv[] = {"-v", "-v", "-v"};
    u32 count = 0;
    const OptionSpec* specs = default_options(&count);
    ParsedOption buf[2]{};
    ParsedOptions out{buf, 0, 2};
    u32 consumed = 0;
    EXPECT_EQ(parse_options(CliArgs{argv, 3}, specs, count, &out, &consumed).code, StatusCode::Invalid);
}
