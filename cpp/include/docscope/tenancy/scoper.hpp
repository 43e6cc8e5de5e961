#pragma once

#include <string>
#include <string_view>

#include "docscope/core/errors.hpp"
#include "docscope/mapper/document.hpp"
#include "docscope/query/filter.hpp"

namespace docscope::tenancy {

    // Soft multi-tenancy: every saved record is tagged with
    // EntityType = "<namespace>.<TypeName>" (or "<TypeName>" without a
    // namespace) and every read path is constrained to the caller's tag.
    // Nothing stops direct store access from reading across namespaces.
    class TenancyScoper {
    public:
        TenancyScoper() = default;

        // Fails with Misconfigured if the trimmed namespace contains the separator.
        [[nodiscard]] static core::Status create(std::string_view namespace_name, TenancyScoper* out) noexcept;

        [[nodiscard]] const std::string& namespace_name() const noexcept { return namespace_; }

        [[nodiscard]] std::string entity_type_for(std::string_view type_name) const;

        // Overwrites any EntityType already present on the record.
        void stamp(mapper::Record* record, std::string_view type_name) const;

        // By-id read check. Untagged records pass. Tagged records from another
        // namespace fail with NotFound, the same kind as a missing record.
        [[nodiscard]] core::Status check_read(std::string_view id, const mapper::Record& record) const noexcept;

        // filter AND EntityType == entity_type_for(type_name)
        [[nodiscard]] query::Filter scope(const query::Filter& filter, std::string_view type_name) const;

    private:
        std::string namespace_;
    };

    // Namespace part of an EntityType tag: the text before the first separator,
    // empty when there is none.
    [[nodiscard]] std::string_view namespace_of(std::string_view entity_type) noexcept;

    // NotFound for an id absent from the store.
    [[nodiscard]] core::Status entity_not_found(std::string_view id) noexcept;

    // NotFound for an id present in the store under another namespace.
    [[nodiscard]] core::Status entity_not_in_namespace(std::string_view id, std::string_view namespace_name) noexcept;

} // namespace docscope::tenancy
