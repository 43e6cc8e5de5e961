#include "docscope/core/text.hpp"

#include <cctype>

namespace docscope::core {

namespace {
    [[nodiscard]] bool is_space(char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    [[nodiscard]] char lower(char c) noexcept {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    [[nodiscard]] char upper(char c) noexcept {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
} // namespace

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

bool is_blank(std::string_view s) noexcept {
    return trim(s).empty();
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

std::string to_title_case(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    bool word_start = true;
    for (char c : s) {
        if (c == ' ') {
            // collapse runs of spaces and drop leading ones
            if (!word_start) {
                out += ' ';
            }
            word_start = true;
            continue;
        }
        out += word_start ? upper(c) : lower(c);
        word_start = false;
    }
    if (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

} // namespace docscope::core
