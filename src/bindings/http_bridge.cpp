#include "lostore/bindings/http.hpp"
#include "lostore/bindings/mime.hpp"
#include "lostore/bindings/range.hpp"
#include "lostore/storage/name_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace lostore::bindings::http {

using namespace lostore::core;
using namespace lostore::storage;

static std::string_view as_text(const BufferView& buf) {
    if (!buf.data) return {};
    return std::string_view(reinterpret_cast<const char*>(buf.data), buf.len);
}

static bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const std::string* HttpResponse::find_header(std::string_view name) const noexcept {
    for (const auto& h : headers) {
        if (iequals(h.name, name)) return &h.value;
    }
    return nullptr;
}

static void reset(HttpResponse* out, u16 status) {
    out->status = status;
    out->headers.clear();
    out->body.reset();
}

// Store failure: generic error, nothing of the partial body survives.
static Status fail(HttpResponse* out, Status s) {
    reset(out, 500);
    return s;
}

static std::string quote_filename(std::string_view name) {
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) name = name.substr(slash + 1);
    std::string q = "\"";
    for (char c : name) {
        if (c == '"' || c == '\\') q.push_back('\\');
        q.push_back(c);
    }
    q.push_back('"');
    return q;
}

static Status copy_range(LoStream& stream, ByteRange range, SpoolBuffer& body) {
    Status s = stream.seek(range.start, Whence::Set, nullptr);
    if (!is_ok(s)) {
        return s;
    }
    i64 remaining = range.length();
    Bytes chunk;
    while (remaining > 0) {
        const i64 want = std::min<i64>(remaining, static_cast<i64>(kChunkBytes));
        s = stream.read(want, &chunk);
        if (!is_ok(s)) {
            return s;
        }
        if (chunk.empty()) {
            // Shorter than its own size; cannot happen inside one transaction.
            return make_status(StatusDomain::Http, StatusCode::Corrupt);
        }
        s = body.write(chunk.data(), chunk.size());
        if (!is_ok(s)) {
            return s;
        }
        remaining -= static_cast<i64>(chunk.size());
    }
    return ok_status();
}

// ========================================================================
// Serving
// ========================================================================

Status serve(LoStore& store, bool has_range, std::string_view range_header, std::string_view name,
             HttpResponse* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    reset(out, 500);

    if (!is_valid_name(name)) {
        reset(out, 404);
        return make_status(StatusDomain::Http, StatusCode::InvalidName);
    }
    db::LoConnection* conn = store.connections().read;
    if (!conn) {
        return fail(out, make_status(StatusDomain::Http, StatusCode::Config));
    }

    db::TxnScope txn;
    Status s = txn.begin(*conn);
    if (!is_ok(s)) {
        return fail(out, s);
    }

    bool found = false;
    s = store.exists(name, &found);
    if (!is_ok(s)) {
        return fail(out, txn.finish(s));
    }
    if (!found) {
        s = txn.finish(ok_status());
        if (!is_ok(s)) {
            return fail(out, s);
        }
        reset(out, 404);
        return make_status(StatusDomain::Http, StatusCode::NotFound);
    }

    ByteRangeSpec spec{};
    const bool ranged = has_range && is_ok(parse_byte_range(range_header, &spec));

    std::unique_ptr<LoStream> stream;
    s = store.open_for_read(name, &stream);
    if (!is_ok(s)) {
        return fail(out, txn.finish(s));
    }

    auto body = std::make_unique<SpoolBuffer>();
    u16 status = 200;
    i64 size = 0;
    ByteRange range{};
    bool unsatisfiable = false;

    if (ranged) {
        s = stream->size(&size);
        if (is_ok(s)) {
            s = resolve_byte_range(spec, size, &range);
            if (s.code == StatusCode::RangeNotSatisfiable) {
                unsatisfiable = true;
                s = ok_status();
            } else if (is_ok(s)) {
                s = copy_range(*stream, range, *body);
                status = 206;
            }
        }
    } else {
        s = stream->readinto([&body](const u8* data, u64 len) {
            return body->write(data, len);
        });
    }

    Status cs = stream->close();
    if (is_ok(s)) {
        s = cs;
    }
    s = txn.finish(s);
    if (!is_ok(s)) {
        return fail(out, s);
    }

    if (unsatisfiable) {
        reset(out, 416);
        out->headers.push_back({"Content-Range", content_range_unsatisfied(size)});
        out->headers.push_back({"Content-Length", "0"});
        return make_status(StatusDomain::Http, StatusCode::RangeNotSatisfiable);
    }

    s = body->rewind();
    if (!is_ok(s)) {
        return fail(out, s);
    }

    const ContentType ct = guess_content_type(name);
    out->status = status;
    out->headers.push_back({"Content-Type", std::string(ct.type)});
    out->headers.push_back({"Content-Length", std::to_string(body->size())});
    out->headers.push_back({"Content-Disposition", "inline; filename=" + quote_filename(name)});
    if (status == 206) {
        out->headers.push_back({"Content-Range", content_range(range, size)});
    }
    if (!ct.encoding.empty()) {
        out->headers.push_back({"Content-Encoding", std::string(ct.encoding)});
    }
    out->body = std::move(body);
    return ok_status();
}

// ========================================================================
// Routing
// ========================================================================

static bool method_is(const BufferView& method, std::string_view expected) {
    return as_text(method) == expected;
}

static const HttpHeader* find_request_header(const HttpRequest& req, std::string_view name) {
    for (u32 i = 0; i < req.header_count; i++) {
        if (iequals(as_text(req.headers[i].name), name)) {
            return &req.headers[i];
        }
    }
    return nullptr;
}

static Status text_body(HttpResponse* out, std::string_view text) {
    auto body = std::make_unique<SpoolBuffer>();
    Status s = body->write(reinterpret_cast<const u8*>(text.data()), text.size());
    if (!is_ok(s)) {
        return s;
    }
    out->headers.push_back({"Content-Type", "text/plain; charset=utf-8"});
    out->headers.push_back({"Content-Length", std::to_string(text.size())});
    out->body = std::move(body);
    return ok_status();
}

static Status handle_get(LoStore& store, std::string_view name, const HttpRequest& req, HttpResponse* out) {
    const HttpHeader* range = find_request_header(req, "Range");
    return serve(store, range != nullptr, range ? as_text(range->value) : std::string_view{}, name, out);
}

static Status handle_put(LoStore& store, std::string_view name, const HttpRequest& req, HttpResponse* out) {
    std::string new_name;
    const u64 count = req.body.len > 0 ? 1 : 0;
    Status s = store.save(name, &req.body, count, &new_name);
    if (!is_ok(s)) {
        return fail(out, s);
    }
    reset(out, 201);
    s = text_body(out, new_name);
    if (!is_ok(s)) {
        return fail(out, s);
    }
    return ok_status();
}

static Status handle_delete(LoStore& store, std::string_view name, HttpResponse* out) {
    Status s = store.remove(name);
    if (s.code == StatusCode::InvalidName) {
        reset(out, 404);
        return s;
    }
    if (!is_ok(s)) {
        return fail(out, s);
    }
    reset(out, 204);
    return ok_status();
}

Status handle_http_request(LoStore& store, const HttpRequest& req, HttpResponse* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    reset(out, 500);

    const std::string_view path = as_text(req.path);
    if (path.size() <= kMediaPrefix.size() || path.substr(0, kMediaPrefix.size()) != kMediaPrefix) {
        reset(out, 404);
        return make_status(StatusDomain::Http, StatusCode::NotFound);
    }
    const std::string_view name = path.substr(kMediaPrefix.size());

    if (method_is(req.method, "GET")) {
        return handle_get(store, name, req, out);
    }
    if (method_is(req.method, "PUT")) {
        return handle_put(store, name, req, out);
    }
    if (method_is(req.method, "DELETE")) {
        return handle_delete(store, name, out);
    }

    reset(out, 405);
    out->headers.push_back({"Allow", "GET, PUT, DELETE"});
    return make_status(StatusDomain::Http, StatusCode::Unsupported);
}

} // namespace lostore::bindings::http
