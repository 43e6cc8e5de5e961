#include "docscope/core/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>

namespace docscope::core {

Status configure_logging(std::string_view level) noexcept {
    const std::string name(level);
    const spdlog::level::level_enum parsed = spdlog::level::from_str(name);

    // from_str maps anything it does not recognise to "off"
    if (parsed == spdlog::level::off && name != "off") {
        return make_status(StatusDomain::Config, StatusCode::Invalid, "unknown log level '" + name + "'");
    }

    spdlog::set_level(parsed);
    return ok_status();
}

Status configure_logging_from_env() noexcept {
    const char* level = std::getenv("DOCSCOPE_LOG_LEVEL");
    if (level == nullptr || level[0] == '\0') {
        return ok_status();
    }
    return configure_logging(level);
}

} // namespace docscope::core
