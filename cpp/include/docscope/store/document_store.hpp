#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docscope/core/errors.hpp"
#include "docscope/mapper/document.hpp"

namespace docscope::store {
    using Record = docscope::mapper::Record;

    // The collaborator every client operation ends in. Implementations must be
    // safe to call from several threads at once. Records are keyed by their
    // "id" member.
    class DocumentStore {
    public:
        virtual ~DocumentStore() = default;

        // Collection every operation of this store addresses.
        [[nodiscard]] virtual const std::string& collection() const noexcept = 0;

        // Executes native query text; appends one record per result row.
        [[nodiscard]] virtual core::Status query(std::string_view text, std::vector<Record>* out) noexcept = 0;

        // Insert-or-replace by record["id"].
        [[nodiscard]] virtual core::Status upsert(const Record& record) noexcept = 0;

        // NotFound (domain Store) if absent.
        [[nodiscard]] virtual core::Status read_by_id(std::string_view id, Record* out) noexcept = 0;

        // NotFound (domain Store) if absent.
        [[nodiscard]] virtual core::Status delete_by_id(std::string_view id) noexcept = 0;
    };

    [[nodiscard]] inline bool is_not_found(const core::Status& s) noexcept {
        return s.code == core::StatusCode::NotFound;
    }

} // namespace docscope::store
