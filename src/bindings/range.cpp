#include "lostore/bindings/range.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace lostore::bindings::http {

using namespace lostore::core;

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Non-negative decimal with nothing else around it.
static bool parse_count(std::string_view s, i64* out) {
    s = trim(s);
    if (s.empty()) return false;
    i64 v = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (ec != std::errc{} || p != s.data() + s.size() || v < 0) {
        return false;
    }
    *out = v;
    return true;
}

Status parse_byte_range(std::string_view header, ByteRangeSpec* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    const Status bad = make_status(StatusDomain::Http, StatusCode::Invalid);

    header = trim(header);
    const auto eq = header.find('=');
    if (eq == std::string_view::npos || header.substr(0, eq) != "bytes") {
        return bad;
    }
    const std::string_view spec = trim(header.substr(eq + 1));
    // A list of ranges fails here through the ',' in a bound.
    const auto dash = spec.find('-');
    if (dash == std::string_view::npos) {
        return bad;
    }
    const std::string_view first = trim(spec.substr(0, dash));
    const std::string_view last = trim(spec.substr(dash + 1));

    ByteRangeSpec r{};
    if (first.empty()) {
        if (!parse_count(last, &r.first)) return bad;
        r.suffix = true;
    } else {
        if (!parse_count(first, &r.first)) return bad;
        if (!last.empty()) {
            if (!parse_count(last, &r.last)) return bad;
            r.has_last = true;
        }
    }
    *out = r;
    return ok_status();
}

Status resolve_byte_range(const ByteRangeSpec& spec, i64 size, ByteRange* out) noexcept {
    if (!out || size < 0) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    i64 start = spec.first;
    i64 end = size - 1;
    if (spec.suffix) {
        start = std::max<i64>(size - spec.first, 0);
    } else if (spec.has_last) {
        end = std::min(spec.last, size - 1);
    }
    // Zero-length suffixes land here with start == size.
    if (start > end) {
        return make_status(StatusDomain::Http, StatusCode::RangeNotSatisfiable);
    }
    *out = ByteRange{start, end};
    return ok_status();
}

std::string content_range(ByteRange range, i64 size) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "bytes %lld-%lld/%lld",
                  static_cast<long long>(range.start), static_cast<long long>(range.end),
                  static_cast<long long>(size));
    return buf;
}

std::string content_range_unsatisfied(i64 size) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "bytes */%lld", static_cast<long long>(size));
    return buf;
}

} // namespace lostore::bindings::http
