#include "lostore/bindings/http.hpp"
#include "lostore/cli/commands.hpp"

#include <cerrno>
#include <cstdarg>
#include <cstring>
#include <string>

namespace lostore::cli {

using namespace lostore::core;
using lostore::storage::LoStore;
using lostore::storage::LoStream;

namespace {

void info(const RunSettings& st, const char* fmt, ...) {
    if (!st.verbose) return;
    std::fprintf(stderr, "info: ");
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

Status io_error() {
    return make_status(StatusDomain::Cli, StatusCode::Io, static_cast<u32>(errno));
}

Status write_out(std::FILE* f, const u8* data, u64 len) {
    if (len > 0 && std::fwrite(data, 1, len, f) != len) {
        return io_error();
    }
    return ok_status();
}

// Streams a whole object into `f` inside one read transaction.
Status copy_object(LoStore& store, const char* name, std::FILE* f) {
    db::LoConnection* conn = store.connections().read;
    if (conn == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Config);
    }
    db::TxnScope txn;
    Status s = txn.begin(*conn);
    if (!is_ok(s)) {
        return s;
    }

    std::unique_ptr<LoStream> stream;
    s = store.open_for_read(name, &stream);
    if (is_ok(s)) {
        s = stream->readinto([f](const u8* data, u64 len) { return write_out(f, data, len); });
        Status cs = stream->close();
        if (is_ok(s)) {
            s = cs;
        }
    }
    return txn.finish(s);
}

Status cmd_put(LoStore& store, const CliArgs& args, const RunSettings& st, std::FILE* out) {
    const char* path = args.argv[0];
    const char* original = args.argc > 1 ? args.argv[1] : base_name(path);

    std::FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::NotFound, static_cast<u32>(errno));
    }
    std::string name;
    Status s = store.save(original, [f](Bytes* chunk, bool* done) {
        chunk->resize(storage::kChunkBytes);
        const size_t n = std::fread(chunk->data(), 1, chunk->size(), f);
        if (n == 0) {
            if (std::ferror(f)) return io_error();
            *done = true;
            return ok_status();
        }
        chunk->resize(n);
        *done = false;
        return ok_status();
    }, &name);
    std::fclose(f);
    if (!is_ok(s)) {
        return s;
    }
    info(st, "stored %s as %s", path, name.c_str());
    std::fprintf(out, "%s\n", name.c_str());
    return ok_status();
}

Status cmd_get(LoStore& store, const CliArgs& args, const RunSettings& st) {
    const char* name = args.argv[0];
    const char* dest = st.output ? st.output : base_name(name);
    if (*dest == '\0') {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    std::FILE* f = std::fopen(dest, "wb");
    if (f == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::PermissionDenied, static_cast<u32>(errno));
    }
    Status s = copy_object(store, name, f);
    if (std::fclose(f) != 0 && is_ok(s)) {
        s = io_error();
    }
    if (!is_ok(s)) {
        std::remove(dest);
        return s;
    }
    info(st, "wrote %s to %s", name, dest);
    return ok_status();
}

const char* reason_phrase(u16 status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 416: return "Range Not Satisfiable";
        default: return "Internal Server Error";
    }
}

Status cmd_serve(LoStore& store, const CliArgs& args, const RunSettings& st, std::FILE* out) {
    namespace http = lostore::bindings::http;
    const char* name = args.argv[0];
    http::HttpResponse resp;
    Status s = http::serve(store, st.range != nullptr, st.range ? st.range : "", name, &resp);
    if (resp.status == 500) {
        return s;
    }
    info(st, "serve %s -> %u", name, static_cast<unsigned>(resp.status));

    std::fprintf(out, "HTTP/1.1 %u %s\r\n", static_cast<unsigned>(resp.status), reason_phrase(resp.status));
    for (const auto& h : resp.headers) {
        std::fprintf(out, "%s: %s\r\n", h.name.c_str(), h.value.c_str());
    }
    std::fprintf(out, "\r\n");
    if (!resp.body) {
        return ok_status();
    }

    Bytes chunk;
    while (true) {
        s = resp.body->read(storage::kChunkBytes, &chunk);
        if (!is_ok(s)) {
            return s;
        }
        if (chunk.empty()) {
            return ok_status();
        }
        s = write_out(out, chunk.data(), chunk.size());
        if (!is_ok(s)) {
            return s;
        }
    }
}

} // namespace

Status run_command(LoStore& store, const CommandInvocation& cmd, const RunSettings& st, std::FILE* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    const CliArgs& args = cmd.args;
    if (cmd.id != CommandId::Help && (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    switch (cmd.id) {
        case CommandId::Help:
            print_usage(out);
            return ok_status();
        case CommandId::Put:
            return cmd_put(store, args, st, out);
        case CommandId::Get:
            return cmd_get(store, args, st);
        case CommandId::Cat:
            return copy_object(store, args.argv[0], out);
        case CommandId::Rm: {
            Status s = store.remove(args.argv[0]);
            if (is_ok(s)) info(st, "removed %s", args.argv[0]);
            return s;
        }
        case CommandId::Size: {
            i64 size = 0;
            Status s = store.size(args.argv[0], &size);
            if (is_ok(s)) std::fprintf(out, "%lld\n", static_cast<long long>(size));
            return s;
        }
        case CommandId::Exists: {
            bool found = false;
            Status s = store.exists(args.argv[0], &found);
            if (is_ok(s)) std::fprintf(out, "%s\n", found ? "true" : "false");
            return s;
        }
        case CommandId::Url: {
            std::string url;
            Status s = store.url(args.argv[0], &url);
            if (is_ok(s)) std::fprintf(out, "%s\n", url.c_str());
            return s;
        }
        case CommandId::Serve:
            return cmd_serve(store, args, st, out);
        case CommandId::None:
            break;
    }
    return make_status(StatusDomain::Cli, StatusCode::Invalid);
}

} // namespace lostore::cli
