#include "lostore/storage/name_codec.hpp"

#include <charconv>

namespace lostore::storage {

using namespace lostore::core;

namespace {
    [[nodiscard]] std::string_view final_component(std::string_view name) noexcept {
        const size_t slash = name.rfind('/');
        return slash == std::string_view::npos ? name : name.substr(slash + 1);
    }
}

std::string_view name_suffixes(std::string_view name) noexcept {
    std::string_view base = final_component(name);
    if (base.empty() || base.back() == '.') {
        return {};
    }
    const size_t first_char = base.find_first_not_of('.');
    if (first_char == std::string_view::npos) {
        return {};
    }
    const size_t dot = base.find('.', first_char);
    if (dot == std::string_view::npos) {
        return {};
    }
    return base.substr(dot);
}

Status encode_name(Loid id, std::string_view original_name, std::string* out) {
    if (!out || loid_is_new(id)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *out = std::to_string(id.v);
    out->append(name_suffixes(original_name));
    return ok_status();
}

Status decode_name(std::string_view name, Loid* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    const std::string_view base = final_component(name);
    const std::string_view stem = base.substr(0, base.find('.'));
    if (stem.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidName);
    }

    u64 v = 0;
    const char* first = stem.data();
    const char* last = stem.data() + stem.size();
    const auto r = std::from_chars(first, last, v, 10);
    if (r.ec != std::errc() || r.ptr != last || v == 0) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidName);
    }
    out->v = v;
    return ok_status();
}

bool is_valid_name(std::string_view name) noexcept {
    Loid id{};
    return is_ok(decode_name(name, &id));
}

} // namespace lostore::storage
