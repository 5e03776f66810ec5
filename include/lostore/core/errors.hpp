#pragma once
#include <cstdint>
#include <type_traits>

namespace lostore::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Network,
        Unsupported,
        Unavailable,
        InvalidName,          // not an object name, or names loid 0
        InvalidMode,          // open mode, or an operation the mode forbids
        RangeNotSatisfiable,
        Backend,              // aux holds the backend's native code when it has one
        Config,               // missing connection or base URL
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Storage,
        Db,
        Http,
        Cli,
    };

    // Every fallible call returns one of these; aux is code specific
    // (errno, SQLite result code, argv index).
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Stable names for log lines.
    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace lostore::core
