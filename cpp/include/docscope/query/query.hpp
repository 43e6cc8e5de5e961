#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "docscope/core/errors.hpp"
#include "docscope/query/filter.hpp"

namespace docscope::query {

    enum class Projection : u8 {
        All = 0,    // full record
        IdOnly = 1, // identifier only
    };

    enum class SortDirection : u8 {
        Ascending = 0,
        Descending = 1,
    };

    struct SortSpec {
        std::string field;
        SortDirection direction{SortDirection::Ascending};
    };

    struct Query {
        Projection projection{Projection::All};
        Filter filter;
        std::optional<SortSpec> sort;
        std::optional<u64> limit;
    };

    // Parses "Field" / "-Field". Only the first comma separated token is used;
    // the store orders by a single column. The field name is returned as written
    // (trimmed); resolving it against a document type is the caller's job.
    [[nodiscard]] core::Status parse_sort_key(std::string_view sort_key, SortSpec* out) noexcept;

    // Renders q into the SQLite document-store dialect against table `collection`:
    //
    //   SELECT id[, body] FROM "<collection>" WHERE <filter>
    //     [ORDER BY json_extract(body, '$."<field>"') ASC|DESC, id ASC] [LIMIT n]
    //
    // The identifier field (declared as "Id" in any casing) renders as the
    // store's reserved `id` column; every other field through json_extract.
    // Literals are quoted, never spliced, so their contents are inert.
    [[nodiscard]] core::Status render(const Query& q, std::string_view collection, std::string* out) noexcept;

} // namespace docscope::query
