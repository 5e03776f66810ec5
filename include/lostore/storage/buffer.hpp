#pragma once

#include <type_traits>

#include "lostore/core/types.hpp"

namespace lostore::storage {
    using u8 = lostore::core::u8;
    using u64 = lostore::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView view_of(const lostore::core::Bytes& b) noexcept {
        return BufferView{b.data(), b.size()};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace lostore::storage
