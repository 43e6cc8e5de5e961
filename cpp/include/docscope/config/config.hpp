#pragma once

#include <string>
#include <vector>

#include "docscope/core/errors.hpp"

namespace docscope::config {

    struct ClientConfig {
        std::string endpoint;                         // store address (database path for the SQLite store)
        std::string auth_key;
        std::string database_id;
        std::string collection_id;
        std::vector<std::string> preferred_locations; // must not be empty
        std::string namespace_name;                   // optional microservice name, no '.' allowed
    };

    // Checks every construction parameter. Returns Misconfigured (domain Config)
    // with a message naming the offending parameter.
    [[nodiscard]] core::Status validate_config(const ClientConfig& cfg) noexcept;

    // Trims surrounding whitespace; a blank name means "no namespace".
    [[nodiscard]] std::string normalize_namespace(std::string_view name);

    // Fills cfg from DOCSCOPE_ENDPOINT, DOCSCOPE_AUTH_KEY, DOCSCOPE_DATABASE,
    // DOCSCOPE_COLLECTION, DOCSCOPE_PREFERRED_LOCATIONS (comma separated) and
    // DOCSCOPE_NAMESPACE. Unset variables leave the corresponding member alone.
    // Does not validate.
    [[nodiscard]] core::Status load_config_from_env(ClientConfig* cfg) noexcept;

    // Splits a comma separated list, trimming entries and dropping empty ones.
    [[nodiscard]] std::vector<std::string> split_list(std::string_view text);

} // namespace docscope::config
