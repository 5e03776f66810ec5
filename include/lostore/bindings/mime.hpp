#pragma once

#include <string_view>

namespace lostore::bindings::http {

    inline constexpr std::string_view kDefaultContentType = "application/octet-stream";

    struct ContentType {
        std::string_view type{kDefaultContentType};
        std::string_view encoding{};  // empty when the name implies none
    };

    // From the name's suffixes only: a trailing compression suffix becomes
    // the encoding and the suffix before it picks the type.
    [[nodiscard]] ContentType guess_content_type(std::string_view name) noexcept;

} // namespace lostore::bindings::http
