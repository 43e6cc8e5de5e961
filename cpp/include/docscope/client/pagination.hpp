#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docscope/core/errors.hpp"
#include "docscope/query/query.hpp"
#include "docscope/store/document_store.hpp"

namespace docscope::client {
    using i64 = docscope::core::i64;
    using u64 = docscope::core::u64;

    // Half-open range [begin, end) of positions in the ordered id list.
    struct PageWindow {
        u64 begin{0};
        u64 end{0};
    };

    // Assumes a validated request (page >= 1, page_size >= 1). Positions past
    // `total` produce an empty window.
    [[nodiscard]] PageWindow page_window(u64 total, i64 page, i64 page_size) noexcept;

    // ceil(total / page_size); 0 when total is 0.
    [[nodiscard]] u64 total_pages(u64 total, i64 page_size) noexcept;

    // Invalid unless page >= 1, page_size >= 1 and sort_key is non-blank.
    [[nodiscard]] core::Status validate_page_request(i64 page, i64 page_size, std::string_view sort_key) noexcept;

    struct RecordPage {
        std::vector<store::Record> records;
        u64 total_count{0};
        u64 total_pages{0};
    };

    // Exact counts over a store that only returns matching rows, in two round
    // trips:
    //
    //   1. ids of every match, ordered: its length is the total count
    //   2. full records for the ids in the page window, ordered again,
    //      because "id IN (...)" alone does not keep the order
    //
    // The second trip is skipped when the window is empty. Writes landing
    // between the two trips are not reflected in the count.
    class PaginationEngine {
    public:
        PaginationEngine(std::shared_ptr<store::DocumentStore> store, std::string collection);

        // `filter` must already carry the tenancy constraint.
        [[nodiscard]] core::Status fetch(const query::Filter& filter,
            const query::SortSpec& sort,
            i64 page,
            i64 page_size,
            RecordPage* out) const noexcept;

    private:
        [[nodiscard]] core::Status query_ids(const query::Filter& filter,
            const query::SortSpec& sort,
            std::vector<std::string>* out) const noexcept;

        std::shared_ptr<store::DocumentStore> store_;
        std::string collection_;
    };

} // namespace docscope::client
