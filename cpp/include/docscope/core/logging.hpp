#pragma once

#include <string_view>

#include "docscope/core/errors.hpp"

namespace docscope::core {

    // Sets the level of the default spdlog logger from a level name
    // ("trace", "debug", "info", "warn", "error", "critical", "off").
    [[nodiscard]] Status configure_logging(std::string_view level) noexcept;

    // Reads DOCSCOPE_LOG_LEVEL; leaves the level untouched when unset.
    [[nodiscard]] Status configure_logging_from_env() noexcept;

} // namespace docscope::core
