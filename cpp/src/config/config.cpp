#include "docscope/config/config.hpp"

#include <cstdlib>

#include "docscope/core/text.hpp"

namespace docscope::config {

using namespace docscope::core;

namespace {
    [[nodiscard]] Status missing(const char* name) noexcept {
        return make_status(StatusDomain::Config, StatusCode::Misconfigured,
            std::string(name) + " cannot be null or empty");
    }

    void read_env(const char* name, std::string* out) {
        const char* value = std::getenv(name);
        if (value != nullptr) {
            *out = value;
        }
    }
} // namespace

std::string normalize_namespace(std::string_view name) {
    return std::string(trim(name));
}

Status validate_config(const ClientConfig& cfg) noexcept {
    if (is_blank(cfg.endpoint)) {
        return missing("endpoint");
    }
    if (is_blank(cfg.auth_key)) {
        return missing("authKey");
    }
    if (is_blank(cfg.database_id)) {
        return missing("databaseId");
    }
    if (is_blank(cfg.collection_id)) {
        return missing("collectionId");
    }
    // Entries themselves are passed through to the store untouched; only the
    // list has to be present.
    if (cfg.preferred_locations.empty()) {
        return missing("preferredLocations");
    }
    if (normalize_namespace(cfg.namespace_name).find(kNamespaceSeparator) != std::string::npos) {
        return make_status(StatusDomain::Config, StatusCode::Misconfigured,
            "The microserviceName cannot contain a period.");
    }
    return ok_status();
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> out;
    while (!text.empty()) {
        const size_t comma = text.find(',');
        const std::string_view item = trim(text.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return out;
}

Status load_config_from_env(ClientConfig* cfg) noexcept {
    if (cfg == nullptr) {
        return make_status(StatusDomain::Config, StatusCode::Invalid, "cfg cannot be null");
    }

    read_env("DOCSCOPE_ENDPOINT", &cfg->endpoint);
    read_env("DOCSCOPE_AUTH_KEY", &cfg->auth_key);
    read_env("DOCSCOPE_DATABASE", &cfg->database_id);
    read_env("DOCSCOPE_COLLECTION", &cfg->collection_id);
    read_env("DOCSCOPE_NAMESPACE", &cfg->namespace_name);

    const char* locations = std::getenv("DOCSCOPE_PREFERRED_LOCATIONS");
    if (locations != nullptr) {
        cfg->preferred_locations = split_list(locations);
    }
    return ok_status();
}

} // namespace docscope::config
