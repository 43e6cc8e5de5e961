#pragma once

#include <string>
#include <string_view>

namespace docscope::core {

    [[nodiscard]] std::string_view trim(std::string_view s) noexcept;

    [[nodiscard]] bool is_blank(std::string_view s) noexcept;

    // ASCII case-insensitive equality.
    [[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

    // Title-cases each space separated word: first letter upper, rest lower.
    // "firstName" -> "Firstname", "AGE" -> "Age".
    [[nodiscard]] std::string to_title_case(std::string_view s);

} // namespace docscope::core
