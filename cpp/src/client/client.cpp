#include "docscope/client/client.hpp"

#include <spdlog/spdlog.h>

#include "docscope/core/text.hpp"

namespace docscope::client {

using namespace docscope::core;

Client::Client(OpenKey,
    config::ClientConfig cfg,
    tenancy::TenancyScoper scoper,
    std::shared_ptr<store::DocumentStore> store)
    : cfg_(std::move(cfg)),
      scoper_(std::move(scoper)),
      store_(store),
      pagination_(std::move(store), cfg_.collection_id) {}

Status Client::invalid(const char* message) noexcept {
    return make_status(StatusDomain::Client, StatusCode::Invalid, message);
}

Status Client::open(const config::ClientConfig& cfg,
    std::shared_ptr<store::DocumentStore> store,
    std::unique_ptr<Client>* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }

    Status s = config::validate_config(cfg);
    if (!is_ok(s)) {
        return s;
    }

    tenancy::TenancyScoper scoper;
    s = tenancy::TenancyScoper::create(cfg.namespace_name, &scoper);
    if (!is_ok(s)) {
        return s;
    }

    if (!store) {
        return make_status(StatusDomain::Config, StatusCode::Misconfigured, "store cannot be null");
    }
    if (store->collection() != cfg.collection_id) {
        return make_status(StatusDomain::Config, StatusCode::Misconfigured,
            "store collection '" + store->collection() + "' does not match collectionId '" + cfg.collection_id + "'");
    }

    spdlog::info("docscope client: database {} collection {} namespace '{}'", cfg.database_id, cfg.collection_id,
        scoper.namespace_name());

    *out = std::make_unique<Client>(OpenKey{}, cfg, std::move(scoper), std::move(store));
    return ok_status();
}

Status Client::save_record(mapper::Record record, std::string_view type_name) const noexcept {
    const auto id = record.find(std::string(kStoreIdField));
    if (id == record.end() || !id->is_string() || is_blank(id->get_ref<const std::string&>())) {
        return invalid("id cannot be null or empty");
    }

    scoper_.stamp(&record, type_name);
    return store_->upsert(record);
}

Status Client::read_record(std::string_view id, mapper::Record* out) const noexcept {
    if (is_blank(id)) {
        return invalid("id cannot be null or empty");
    }

    mapper::Record record;
    Status s = store_->read_by_id(id, &record);
    if (store::is_not_found(s)) {
        return tenancy::entity_not_found(id);
    }
    if (!is_ok(s)) {
        return s;
    }

    s = scoper_.check_read(id, record);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(record);
    return ok_status();
}

Status Client::find_first(const query::Filter& filter,
    std::string_view type_name,
    std::optional<mapper::Record>* out) const noexcept {
    if (filter.empty()) {
        return invalid("predicate cannot be null");
    }

    query::Query q;
    q.filter = scoper_.scope(filter, type_name);
    q.limit = 1;

    std::string text;
    Status s = query::render(q, cfg_.collection_id, &text);
    if (!is_ok(s)) {
        return s;
    }
    spdlog::debug("docscope client: get {}", text);

    std::vector<mapper::Record> rows;
    s = store_->query(text, &rows);
    if (!is_ok(s)) {
        return s;
    }

    if (rows.empty()) {
        out->reset();
    } else {
        *out = std::move(rows.front());
    }
    return ok_status();
}

Status Client::list_records(const query::Filter& filter,
    std::string_view type_name,
    const query::SortSpec& sort,
    i64 page,
    i64 page_size,
    RecordPage* out) const noexcept {
    if (filter.empty()) {
        return invalid("predicate cannot be null");
    }
    return pagination_.fetch(scoper_.scope(filter, type_name), sort, page, page_size, out);
}

Status Client::remove_record(std::string_view id) const noexcept {
    Status s = store_->delete_by_id(id);
    if (store::is_not_found(s)) {
        // deleted concurrently after the existence check
        return tenancy::entity_not_found(id);
    }
    return s;
}

} // namespace docscope::client
