#pragma once

#include <string_view>

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"

namespace lostore::storage {
    using u8 = lostore::core::u8;

    // Closed set of access modes, decoded once from the textual form.
    //
    //   text    mode           read  write  create  starts at
    //   rb      Read           +                    0
    //   wb      Write                +      +       0
    //   r+b     Update         +     +              0
    //   w+b     ReadWrite      +     +      +       0
    //   ab      Append               +      +       end
    //   a+b     CreateAppend   +     +      +       end
    //
    // No mode truncates an existing object.
    enum class OpenMode : u8 {
        Read = 0,
        Write = 1,
        ReadWrite = 2,
        Append = 3,
        CreateAppend = 4,
        Update = 5,
    };

    // Which connection alias serves a mode.
    enum class ConnRole : u8 {
        Read = 0,
        Write = 1,
    };

    // InvalidMode for text modes, unknown strings and empty input.
    [[nodiscard]] lostore::core::Status parse_open_mode(std::string_view text, OpenMode* out) noexcept;

    [[nodiscard]] const char* open_mode_text(OpenMode mode) noexcept;

    [[nodiscard]] constexpr bool mode_readable(OpenMode mode) noexcept {
        return mode == OpenMode::Read || mode == OpenMode::ReadWrite || mode == OpenMode::CreateAppend ||
               mode == OpenMode::Update;
    }

    [[nodiscard]] constexpr bool mode_writable(OpenMode mode) noexcept {
        return mode != OpenMode::Read;
    }

    [[nodiscard]] constexpr bool mode_can_create(OpenMode mode) noexcept {
        return mode_writable(mode) && mode != OpenMode::Update;
    }

    [[nodiscard]] constexpr bool mode_appends(OpenMode mode) noexcept {
        return mode == OpenMode::Append || mode == OpenMode::CreateAppend;
    }

    [[nodiscard]] constexpr lostore::core::LoAccess mode_access(OpenMode mode) noexcept {
        if (mode_readable(mode) && mode_writable(mode)) return lostore::core::LoAccess::ReadWrite;
        if (mode_writable(mode)) return lostore::core::LoAccess::Write;
        return lostore::core::LoAccess::Read;
    }

    [[nodiscard]] constexpr ConnRole mode_role(OpenMode mode) noexcept {
        return mode_writable(mode) ? ConnRole::Write : ConnRole::Read;
    }

} // namespace lostore::storage
