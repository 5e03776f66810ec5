#pragma once

#include <string>
#include <string_view>

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"

namespace lostore::bindings::http {
    using i64 = lostore::core::i64;

    // One `bytes=` range as written in the request, before the object size
    // is known.
    struct ByteRangeSpec {
        i64 first{0};        // suffix length when `suffix` is set
        i64 last{0};         // meaningful only with has_last
        bool has_last{false};
        bool suffix{false};  // "bytes=-N"
    };

    // Inclusive on both ends: 0 <= start <= end < size.
    struct ByteRange {
        i64 start{0};
        i64 end{0};

        [[nodiscard]] i64 length() const noexcept { return end - start + 1; }
    };

    // Invalid for anything but a single range in `bytes` units; callers
    // ignore the header in that case.
    [[nodiscard]] lostore::core::Status parse_byte_range(std::string_view header, ByteRangeSpec* out) noexcept;

    // A suffix starts at size - N clamped to 0; a missing end means the last
    // byte and a given end is clamped to it. RangeNotSatisfiable when the
    // resulting window is empty or inverted.
    [[nodiscard]] lostore::core::Status resolve_byte_range(const ByteRangeSpec& spec, i64 size,
                                                           ByteRange* out) noexcept;

    // "bytes <start>-<end>/<size>"
    [[nodiscard]] std::string content_range(ByteRange range, i64 size);
    // "bytes */<size>"
    [[nodiscard]] std::string content_range_unsatisfied(i64 size);

} // namespace lostore::bindings::http
