#include "docscope/client/pagination.hpp"

#include <spdlog/spdlog.h>

#include "docscope/core/text.hpp"

namespace docscope::client {

using namespace docscope::core;

PageWindow page_window(u64 total, i64 page, i64 page_size) noexcept {
    if (page < 1 || page_size < 1) {
        return PageWindow{};
    }
    const u64 size = static_cast<u64>(page_size);
    const u64 index = static_cast<u64>(page - 1);

    // index * size overflows long before it could be inside any real total
    if (index != 0 && size > total / index) {
        return PageWindow{total, total};
    }
    const u64 skip = index * size;
    if (skip >= total) {
        return PageWindow{total, total};
    }
    const u64 end = size > total - skip ? total : skip + size;
    return PageWindow{skip, end};
}

u64 total_pages(u64 total, i64 page_size) noexcept {
    if (total == 0 || page_size < 1) {
        return 0;
    }
    const u64 size = static_cast<u64>(page_size);
    return (total - 1) / size + 1;
}

Status validate_page_request(i64 page, i64 page_size, std::string_view sort_key) noexcept {
    if (page <= 0) {
        return make_status(StatusDomain::Client, StatusCode::Invalid, "page must be greater than 0");
    }
    if (page_size <= 0) {
        return make_status(StatusDomain::Client, StatusCode::Invalid, "pageSize must be greater than 0");
    }
    if (is_blank(sort_key)) {
        return make_status(StatusDomain::Client, StatusCode::Invalid, "sortBy cannot be null or empty");
    }
    return ok_status();
}

PaginationEngine::PaginationEngine(std::shared_ptr<store::DocumentStore> store, std::string collection)
    : store_(std::move(store)), collection_(std::move(collection)) {}

Status PaginationEngine::query_ids(const query::Filter& filter,
    const query::SortSpec& sort,
    std::vector<std::string>* out) const noexcept {
    query::Query q;
    q.projection = query::Projection::IdOnly;
    q.filter = filter;
    q.sort = sort;

    std::string text;
    Status s = query::render(q, collection_, &text);
    if (!is_ok(s)) {
        return s;
    }
    spdlog::debug("pagination: id query {}", text);

    std::vector<store::Record> rows;
    s = store_->query(text, &rows);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    out->reserve(rows.size());
    for (const store::Record& row : rows) {
        const auto id = row.find(std::string(kStoreIdField));
        if (id == row.end() || !id->is_string()) {
            return make_status(StatusDomain::Client, StatusCode::Corrupt, "id query returned a row without an id");
        }
        out->push_back(id->get<std::string>());
    }
    return ok_status();
}

Status PaginationEngine::fetch(const query::Filter& filter,
    const query::SortSpec& sort,
    i64 page,
    i64 page_size,
    RecordPage* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Client, StatusCode::Invalid, "out cannot be null");
    }
    if (page <= 0 || page_size <= 0) {
        return validate_page_request(page, page_size, sort.field);
    }
    if (filter.empty()) {
        return make_status(StatusDomain::Client, StatusCode::Invalid, "predicate cannot be null");
    }
    if (!store_) {
        return make_status(StatusDomain::Client, StatusCode::Unavailable, "no document store");
    }

    std::vector<std::string> ids;
    Status s = query_ids(filter, sort, &ids);
    if (!is_ok(s)) {
        return s;
    }

    RecordPage result;
    result.total_count = ids.size();
    result.total_pages = total_pages(result.total_count, page_size);

    const PageWindow window = page_window(result.total_count, page, page_size);
    spdlog::debug("pagination: page {} size {} -> [{}, {}) of {}", page, page_size, window.begin, window.end,
        result.total_count);

    if (window.begin < window.end) {
        std::vector<query::Literal> subset;
        subset.reserve(window.end - window.begin);
        for (u64 i = window.begin; i < window.end; ++i) {
            subset.emplace_back(std::move(ids[i]));
        }

        query::Query q;
        q.projection = query::Projection::All;
        q.filter = query::Filter::in(std::string(kIdField), std::move(subset));
        q.sort = sort;

        std::string text;
        s = query::render(q, collection_, &text);
        if (!is_ok(s)) {
            return s;
        }
        spdlog::debug("pagination: page query {}", text);

        s = store_->query(text, &result.records);
        if (!is_ok(s)) {
            return s;
        }
    }

    *out = std::move(result);
    return ok_status();
}

} // namespace docscope::client
