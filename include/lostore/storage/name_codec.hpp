#pragma once

#include <string>
#include <string_view>

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"

namespace lostore::storage {

    // External names have the form <decimal loid>[.<suffix>]*, e.g. "482913.tar.gz".
    // Suffixes are metadata for content typing; only the stem identifies the object.

    // Decimal loid followed by every dot-suffix of `original_name`, in order.
    // Invalid when `id` is the create sentinel.
    [[nodiscard]] lostore::core::Status encode_name(lostore::core::Loid id,
                                                    std::string_view original_name,
                                                    std::string* out);

    // Local validation only: never touches the store. InvalidName unless the
    // stem of the final path component is a base-10 integer naming a real
    // object (zero is rejected).
    [[nodiscard]] lostore::core::Status decode_name(std::string_view name, lostore::core::Loid* out) noexcept;

    [[nodiscard]] bool is_valid_name(std::string_view name) noexcept;

    // Concatenated dot-suffixes of the final path component (".tar.gz" for
    // "a/b.tar.gz"). Leading dots do not start a suffix and a component that
    // ends in '.' has none.
    [[nodiscard]] std::string_view name_suffixes(std::string_view name) noexcept;

} // namespace lostore::storage
