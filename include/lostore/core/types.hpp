#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>
#include <vector>

namespace lostore::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    using Bytes = std::vector<u8>;

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // Large object identifier assigned by the backing store.
    struct LoidTag {};
    using Loid = Id<LoidTag, u64>;

    // Loid{0} means "not yet created"; it is only accepted by the create-on-open path.
    inline constexpr Loid kLoidNew{0};

    [[nodiscard]] constexpr bool loid_is_new(Loid id) noexcept {
        return id.v == kLoidNew.v;
    }

    // Remote descriptor returned by lo_open; -1 when nothing is open.
    struct LoFdTag {};
    using LoFd = Id<LoFdTag, i32>;

    inline constexpr LoFd kNoFd{-1};

    enum class Whence : u8 {
        Set = 0,
        Cur = 1,
        End = 2,
    };

    // Access bits requested from the backing store on lo_open.
    enum class LoAccess : u8 {
        Read = 1,
        Write = 2,
        ReadWrite = 3,
    };

    [[nodiscard]] constexpr bool access_can_read(LoAccess a) noexcept {
        return (static_cast<u8>(a) & static_cast<u8>(LoAccess::Read)) != 0;
    }

    [[nodiscard]] constexpr bool access_can_write(LoAccess a) noexcept {
        return (static_cast<u8>(a) & static_cast<u8>(LoAccess::Write)) != 0;
    }

    static_assert(sizeof(Loid) == 8);
    static_assert(std::is_trivially_copyable_v<Loid>);
    static_assert(std::is_trivially_copyable_v<LoFd>);
    static_assert(std::is_standard_layout_v<Loid>);

} // namespace lostore::core
