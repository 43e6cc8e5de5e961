#include "docscope/core/errors.hpp"

namespace docscope::core {

std::string_view status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Unknown: return "unknown";
        case StatusCode::Invalid: return "invalid";
        case StatusCode::Misconfigured: return "misconfigured";
        case StatusCode::NotFound: return "not_found";
        case StatusCode::Conflict: return "conflict";
        case StatusCode::Busy: return "busy";
        case StatusCode::Corrupt: return "corrupt";
        case StatusCode::Io: return "io";
        case StatusCode::Unsupported: return "unsupported";
        case StatusCode::Unavailable: return "unavailable";
    }
    return "unknown";
}

std::string_view status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "core";
        case StatusDomain::Config: return "config";
        case StatusDomain::Query: return "query";
        case StatusDomain::Tenancy: return "tenancy";
        case StatusDomain::Mapper: return "mapper";
        case StatusDomain::Store: return "store";
        case StatusDomain::Client: return "client";
    }
    return "unknown";
}

std::string to_string(const Status& s) {
    std::string out;
    out += status_domain_name(s.domain);
    out += '/';
    out += status_code_name(s.code);
    if (!s.message.empty()) {
        out += ": ";
        out += s.message;
    }
    return out;
}

} // namespace docscope::core
