#include "lostore/core/errors.hpp"

namespace lostore::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Network: return "Network";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
        case StatusCode::InvalidName: return "InvalidName";
        case StatusCode::InvalidMode: return "InvalidMode";
        case StatusCode::RangeNotSatisfiable: return "RangeNotSatisfiable";
        case StatusCode::Backend: return "Backend";
        case StatusCode::Config: return "Config";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Storage: return "Storage";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Http: return "Http";
        case StatusDomain::Cli: return "Cli";
    }
    return "Unknown";
}

} // namespace lostore::core
