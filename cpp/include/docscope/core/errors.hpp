#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "docscope/core/types.hpp"

namespace docscope::core {

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,        // bad call arguments (validation error)
        Misconfigured,  // bad construction parameters (configuration error)
        NotFound,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Config,
        Query,
        Tenancy,
        Mapper,
        Store,
        Client,
    };

    // Failures of the same kind share code and domain and differ only in `message`.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
        std::string message{};
    };

    [[nodiscard]] inline Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux, {}};
    }

    [[nodiscard]] inline Status make_status(StatusDomain domain, StatusCode code, std::string message, u32 aux = 0) noexcept {
        return Status{code, domain, aux, std::move(message)};
    }

    [[nodiscard]] inline bool is_ok(const Status& s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] inline Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] std::string_view status_code_name(StatusCode code) noexcept;
    [[nodiscard]] std::string_view status_domain_name(StatusDomain domain) noexcept;

    // "<domain>/<code>: <message>" (message omitted when empty)
    [[nodiscard]] std::string to_string(const Status& s);

} // namespace docscope::core
