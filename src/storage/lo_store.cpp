#include "lostore/storage/lo_store.hpp"
#include "lostore/storage/name_codec.hpp"

#include <utility>

namespace lostore::storage {

using namespace lostore::core;

LoStore::LoStore(StoreConfig cfg, db::Connections conns) noexcept
    : cfg_(std::move(cfg)), conns_(conns) {
    if (!cfg_.base_url.empty() && cfg_.base_url.back() != '/') {
        cfg_.base_url.push_back('/');
    }
}

// ========================================================================
// Lookup
// ========================================================================

Status LoStore::exists(std::string_view name, bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *out = false;
    Loid id{};
    if (!is_ok(decode_name(name, &id))) {
        return ok_status();
    }
    if (!conns_.read) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }

    db::TxnScope txn;
    Status s = txn.begin(*conns_.read);
    if (!is_ok(s)) {
        return s;
    }
    return txn.finish(conns_.read->lo_exists(id, out));
}

Status LoStore::size(std::string_view name, i64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Loid id{};
    Status s = decode_name(name, &id);
    if (!is_ok(s)) {
        return s;
    }
    if (!conns_.read) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }

    db::TxnScope txn;
    s = txn.begin(*conns_.read);
    if (!is_ok(s)) {
        return s;
    }

    std::unique_ptr<LoStream> stream;
    s = open_for_read(name, &stream);
    if (is_ok(s)) {
        s = stream->size(out);
        Status cs = stream->close();
        if (is_ok(s)) {
            s = cs;
        }
    }
    return txn.finish(s);
}

// ========================================================================
// Streams
// ========================================================================

Status LoStore::require_transaction(const db::LoConnection* conn) noexcept {
    if (!conn) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }
    if (!conn->in_transaction()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return ok_status();
}

Status LoStore::open_for_read(std::string_view name, std::unique_ptr<LoStream>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Loid id{};
    Status s = decode_name(name, &id);
    if (!is_ok(s)) {
        return s;
    }
    s = require_transaction(conns_.read);
    if (!is_ok(s)) {
        return s;
    }

    bool found = false;
    s = exists(name, &found);
    if (!is_ok(s)) {
        return s;
    }
    if (!found) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    auto stream = std::make_unique<LoStream>(conns_, id);
    s = stream->open(OpenMode::Read, std::to_string(id.v));
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(stream);
    return ok_status();
}

Status LoStore::open_for_write(std::string_view name, OpenMode mode, std::unique_ptr<LoStream>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!mode_writable(mode)) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidMode);
    }
    Loid id{};
    Status s = decode_name(name, &id);
    if (!is_ok(s)) {
        return s;
    }
    s = require_transaction(conns_.write);
    if (!is_ok(s)) {
        return s;
    }

    bool found = false;
    s = conns_.write->lo_exists(id, &found);
    if (!is_ok(s)) {
        return s;
    }
    if (!found) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    auto stream = std::make_unique<LoStream>(conns_, id);
    s = stream->open(mode, name);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(stream);
    return ok_status();
}

Status LoStore::create(std::string_view original_name, OpenMode mode, std::unique_ptr<LoStream>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!mode_can_create(mode)) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidMode);
    }
    Status s = require_transaction(conns_.write);
    if (!is_ok(s)) {
        return s;
    }
    auto stream = std::make_unique<LoStream>(conns_, kLoidNew);
    s = stream->open(mode, original_name);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(stream);
    return ok_status();
}

// ========================================================================
// Save / remove
// ========================================================================

Status LoStore::save(std::string_view original_name, const BufferView* chunks, u64 count,
                     std::string* new_name) noexcept {
    if (count > 0 && !chunks) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    u64 next = 0;
    return save(original_name, [chunks, count, &next](Bytes* chunk, bool* done) {
        if (next == count) {
            *done = true;
            return ok_status();
        }
        const BufferView& view = chunks[next++];
        chunk->assign(view.data, view.data + view.len);
        *done = false;
        return ok_status();
    }, new_name);
}

Status LoStore::save(std::string_view original_name, const ChunkSource& source,
                     std::string* new_name) noexcept {
    if (!new_name || !source) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!conns_.write) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }

    db::TxnScope txn;
    Status s = txn.begin(*conns_.write);
    if (!is_ok(s)) {
        return s;
    }

    LoStream stream(conns_, kLoidNew);
    s = stream.open(OpenMode::Write, original_name);
    if (is_ok(s)) {
        s = save_into(stream, source);
        Status cs = stream.close();
        if (is_ok(s)) {
            s = cs;
        }
    }
    s = txn.finish(s);
    if (!is_ok(s)) {
        return s;
    }
    *new_name = stream.name();
    return ok_status();
}

Status LoStore::save_into(LoStream& stream, const ChunkSource& source) noexcept {
    Bytes chunk;
    while (true) {
        bool done = false;
        Status s = source(&chunk, &done);
        if (!is_ok(s)) {
            return s;
        }
        if (done) {
            return ok_status();
        }
        if (chunk.empty()) {
            continue;
        }
        const BufferView view = view_of(chunk);
        s = stream.write_all(&view, 1);
        if (!is_ok(s)) {
            return s;
        }
    }
}

Status LoStore::remove(std::string_view name) noexcept {
    Loid id{};
    Status s = decode_name(name, &id);
    if (!is_ok(s)) {
        return s;
    }
    if (!conns_.write) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }

    db::TxnScope txn;
    s = txn.begin(*conns_.write);
    if (!is_ok(s)) {
        return s;
    }
    s = conns_.write->lo_unlink(id);
    if (s.code == StatusCode::NotFound) {
        s = ok_status();
    }
    return txn.finish(s);
}

// ========================================================================
// Naming
// ========================================================================

Status LoStore::url(std::string_view name, std::string* out) const {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Loid id{};
    Status s = decode_name(name, &id);
    if (!is_ok(s)) {
        return s;
    }
    if (cfg_.base_url.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }

    std::string_view rel = name;
    while (!rel.empty() && rel.front() == '/') {
        rel.remove_prefix(1);
    }
    std::string joined = cfg_.base_url;
    joined.reserve(joined.size() + rel.size());
    for (char c : rel) {
        joined.push_back(c == '\\' ? '/' : c);
    }
    *out = std::move(joined);
    return ok_status();
}

Status LoStore::listdir(std::string_view) const noexcept {
    return make_status(StatusDomain::Storage, StatusCode::Unsupported);
}

} // namespace lostore::storage
