#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"
#include "lostore/db/connection.hpp"
#include "lostore/storage/buffer.hpp"
#include "lostore/storage/lo_stream.hpp"
#include "lostore/storage/open_mode.hpp"

namespace lostore::storage {

    struct StoreConfig {
        // Prefix for public URLs. A trailing '/' is added when missing.
        std::string base_url;
    };

    // Pulls the next piece of content. Sets *done once nothing is left; the
    // chunk written alongside done is ignored.
    using ChunkSource = std::function<lostore::core::Status(lostore::core::Bytes* chunk, bool* done)>;

    // Named-object view over the large-object store.
    //
    // Names are validated locally before any store access. Multi-call
    // operations run inside one transaction on the connection they use, or
    // inside the caller's transaction when one is already active.
    class LoStore {
    public:
        LoStore(StoreConfig cfg, lostore::db::Connections conns) noexcept;

        [[nodiscard]] const StoreConfig& config() const noexcept { return cfg_; }
        [[nodiscard]] lostore::db::Connections connections() const noexcept { return conns_; }

        // Invalid names simply do not exist.
        [[nodiscard]] lostore::core::Status exists(std::string_view name, bool* out) noexcept;

        // Stream openers need a transaction already running on the connection
        // they use (Invalid otherwise); the stream dies with it.

        // NotFound for a valid name without an object.
        [[nodiscard]] lostore::core::Status open_for_read(std::string_view name,
                                                          std::unique_ptr<LoStream>* out) noexcept;
        // Opens an existing object with a write-capable mode.
        [[nodiscard]] lostore::core::Status open_for_write(std::string_view name, OpenMode mode,
                                                           std::unique_ptr<LoStream>* out) noexcept;
        // Creates a new object; the stream's name() carries the assigned name.
        [[nodiscard]] lostore::core::Status create(std::string_view original_name, OpenMode mode,
                                                   std::unique_ptr<LoStream>* out) noexcept;

        // Writes every chunk to a new object and returns its name. Nothing is
        // left behind on failure.
        [[nodiscard]] lostore::core::Status save(std::string_view original_name,
                                                 const BufferView* chunks, u64 count,
                                                 std::string* new_name) noexcept;
        [[nodiscard]] lostore::core::Status save(std::string_view original_name,
                                                 const ChunkSource& source,
                                                 std::string* new_name) noexcept;

        // Succeeds when the object is already gone.
        [[nodiscard]] lostore::core::Status remove(std::string_view name) noexcept;

        [[nodiscard]] lostore::core::Status size(std::string_view name, i64* out) noexcept;

        // Config when no base URL is configured.
        [[nodiscard]] lostore::core::Status url(std::string_view name, std::string* out) const;

        // Objects have no directory structure.
        [[nodiscard]] lostore::core::Status listdir(std::string_view path) const noexcept;

        // Final names are assigned by the store, so candidates pass through.
        [[nodiscard]] std::string generate_filename(std::string_view name) const {
            return std::string(name);
        }
        [[nodiscard]] std::string get_available_name(std::string_view name) const {
            return std::string(name);
        }

    private:
        [[nodiscard]] static lostore::core::Status require_transaction(const lostore::db::LoConnection* conn) noexcept;
        [[nodiscard]] lostore::core::Status save_into(LoStream& stream, const ChunkSource& source) noexcept;

        StoreConfig cfg_;
        lostore::db::Connections conns_;
    };

} // namespace lostore::storage
