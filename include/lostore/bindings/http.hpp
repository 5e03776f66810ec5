#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "lostore/bindings/spool.hpp"
#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"
#include "lostore/storage/buffer.hpp"
#include "lostore/storage/lo_store.hpp"

namespace lostore::bindings::http {
    using u16 = lostore::core::u16;
    using u32 = lostore::core::u32;
    using BufferView = lostore::storage::BufferView;

    struct HttpHeader {
        BufferView name{};
        BufferView value{};
    };

    struct HttpRequest {
        BufferView method{};
        BufferView path{};
        BufferView body{};
        const HttpHeader* headers{nullptr};
        u32 header_count{0};
    };

    struct HttpHeaderField {
        std::string name;
        std::string value;
    };

    struct HttpResponse {
        u16 status{200};
        std::vector<HttpHeaderField> headers;
        // Null when the response has no body.
        std::unique_ptr<SpoolBuffer> body;

        // Case-insensitive; null when absent.
        [[nodiscard]] const std::string* find_header(std::string_view name) const noexcept;
    };

    // Route prefix for stored objects.
    inline constexpr std::string_view kMediaPrefix = "/media/";

    // Serves one object as 200 (whole), 206 (range), 404 (malformed or
    // absent name) or 416 (unsatisfiable range). A range header that is not
    // a single `bytes` range is ignored. Size and content are read inside a
    // single transaction on the read connection, and the stream is closed
    // before it ends.
    //
    // The response is always filled in. The status is ok for 200 and 206;
    // store failures leave a 500 with no headers and no body.
    lostore::core::Status serve(lostore::storage::LoStore& store, bool has_range,
                                std::string_view range_header, std::string_view name,
                                HttpResponse* out) noexcept;

    //   GET    /media/<name>   serve
    //   PUT    /media/<name>   save the body, 201 with the new name
    //   DELETE /media/<name>   204, also when already gone
    lostore::core::Status handle_http_request(lostore::storage::LoStore& store, const HttpRequest& req,
                                              HttpResponse* out) noexcept;

    static_assert(std::is_trivially_copyable_v<HttpHeader>);
    static_assert(std::is_trivially_copyable_v<HttpRequest>);
    static_assert(std::is_standard_layout_v<HttpHeader>);
    static_assert(std::is_standard_layout_v<HttpRequest>);

} // namespace lostore::bindings::http
