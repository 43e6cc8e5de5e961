#include "docscope/tenancy/scoper.hpp"

#include <spdlog/spdlog.h>

#include "docscope/config/config.hpp"

namespace docscope::tenancy {

using namespace docscope::core;

Status TenancyScoper::create(std::string_view namespace_name, TenancyScoper* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Tenancy, StatusCode::Invalid, "out cannot be null");
    }

    std::string ns = config::normalize_namespace(namespace_name);
    if (ns.find(kNamespaceSeparator) != std::string::npos) {
        return make_status(StatusDomain::Config, StatusCode::Misconfigured,
            "The microserviceName cannot contain a period.");
    }

    out->namespace_ = std::move(ns);
    return ok_status();
}

std::string TenancyScoper::entity_type_for(std::string_view type_name) const {
    if (namespace_.empty()) {
        return std::string(type_name);
    }
    std::string tag = namespace_;
    tag += kNamespaceSeparator;
    tag += type_name;
    return tag;
}

void TenancyScoper::stamp(mapper::Record* record, std::string_view type_name) const {
    if (record == nullptr) {
        return;
    }
    (*record)[std::string(kEntityTypeField)] = entity_type_for(type_name);
}

Status TenancyScoper::check_read(std::string_view id, const mapper::Record& record) const noexcept {
    if (!record.is_object()) {
        return entity_not_found(id);
    }

    const auto it = record.find(std::string(kEntityTypeField));
    if (it == record.end() || it->is_null()) {
        // Written outside this client; there is nothing to check against.
        return ok_status();
    }

    if (it->is_string() && namespace_of(it->get_ref<const std::string&>()) == namespace_) {
        return ok_status();
    }

    spdlog::warn("entity {} is tagged {} and is not visible in namespace '{}'", id, it->dump(), namespace_);
    return entity_not_in_namespace(id, namespace_);
}

query::Filter TenancyScoper::scope(const query::Filter& filter, std::string_view type_name) const {
    return filter && query::Filter::compare(std::string(kEntityTypeField), query::CompareOp::Eq,
        query::Literal{entity_type_for(type_name)});
}

std::string_view namespace_of(std::string_view entity_type) noexcept {
    const size_t sep = entity_type.find(kNamespaceSeparator);
    if (sep == std::string_view::npos) {
        return {};
    }
    return entity_type.substr(0, sep);
}

Status entity_not_found(std::string_view id) noexcept {
    return make_status(StatusDomain::Client, StatusCode::NotFound,
        "An entity with id " + std::string(id) + " was not found in the data store.");
}

Status entity_not_in_namespace(std::string_view id, std::string_view namespace_name) noexcept {
    return make_status(StatusDomain::Client, StatusCode::NotFound,
        "An entity with id " + std::string(id) + " was found in the data store but is not in the '" +
            std::string(namespace_name) + "' namespace.");
}

} // namespace docscope::tenancy
