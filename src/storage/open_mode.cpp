#include "lostore/storage/open_mode.hpp"

namespace lostore::storage {

using namespace lostore::core;

Status parse_open_mode(std::string_view text, OpenMode* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    struct Entry {
        std::string_view text;
        OpenMode mode;
    };
    static constexpr Entry kModes[] = {
        {"rb", OpenMode::Read},
        {"wb", OpenMode::Write},
        {"r+b", OpenMode::Update},
        {"w+b", OpenMode::ReadWrite},
        {"ab", OpenMode::Append},
        {"a+b", OpenMode::CreateAppend},
    };

    for (const Entry& e : kModes) {
        if (e.text == text) {
            *out = e.mode;
            return ok_status();
        }
    }
    return make_status(StatusDomain::Storage, StatusCode::InvalidMode);
}

const char* open_mode_text(OpenMode mode) noexcept {
    switch (mode) {
        case OpenMode::Read: return "rb";
        case OpenMode::Write: return "wb";
        case OpenMode::ReadWrite: return "w+b";
        case OpenMode::Append: return "ab";
        case OpenMode::CreateAppend: return "a+b";
        case OpenMode::Update: return "r+b";
    }
    return "rb";
}

} // namespace lostore::storage
