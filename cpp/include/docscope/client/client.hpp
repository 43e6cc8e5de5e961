#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docscope/client/pagination.hpp"
#include "docscope/config/config.hpp"
#include "docscope/core/errors.hpp"
#include "docscope/core/text.hpp"
#include "docscope/mapper/document.hpp"
#include "docscope/query/predicate.hpp"
#include "docscope/query/query.hpp"
#include "docscope/store/document_store.hpp"
#include "docscope/tenancy/scoper.hpp"

namespace docscope::client {

    template <typename T>
    struct Page {
        std::vector<T> data;
        u64 total_count{0};
        u64 total_pages{0};
    };

    // Sort field as declared on T (case-insensitive match), falling back to
    // the title-cased key for names T does not declare.
    template <typename T>
    [[nodiscard]] std::string resolve_sort_field(std::string_view name) {
        const std::string_view declared = mapper::resolve_field<T>(name);
        if (!declared.empty()) {
            return std::string(declared);
        }
        return core::to_title_case(name);
    }

    // Typed CRUD over a DocumentStore, scoped to the configured namespace.
    // Holds only immutable configuration and the shared store; safe to use
    // from several threads.
    class Client {
        struct OpenKey {
            explicit OpenKey() = default;
        };

    public:
        // Reachable only through open().
        Client(OpenKey, config::ClientConfig cfg, tenancy::TenancyScoper scoper,
            std::shared_ptr<store::DocumentStore> store);

        // Validates cfg before touching the store; a bad configuration yields
        // Misconfigured and no client. The store must address cfg.collection_id.
        [[nodiscard]] static core::Status open(const config::ClientConfig& cfg,
            std::shared_ptr<store::DocumentStore> store,
            std::unique_ptr<Client>* out) noexcept;

        [[nodiscard]] const config::ClientConfig& config() const noexcept { return cfg_; }
        [[nodiscard]] const std::string& namespace_name() const noexcept { return scoper_.namespace_name(); }

        // Upsert by id, stamping EntityType.
        template <typename T>
        [[nodiscard]] core::Status save(const T* doc) const noexcept {
            if (doc == nullptr) {
                return invalid("data cannot be null");
            }
            mapper::Record record;
            core::Status s = mapper::to_record(*doc, &record);
            if (!core::is_ok(s)) {
                return s;
            }
            return save_record(std::move(record), mapper::type_name_of<T>());
        }

        // NotFound if the id is absent or belongs to another namespace.
        template <typename T>
        [[nodiscard]] core::Status get_by_id(std::string_view id, T* out) const noexcept {
            if (out == nullptr) {
                return invalid("out cannot be null");
            }
            mapper::Record record;
            core::Status s = read_record(id, &record);
            if (!core::is_ok(s)) {
                return s;
            }
            return mapper::from_record(record, out);
        }

        // First match, or std::nullopt when nothing matches.
        template <typename T>
        [[nodiscard]] core::Status get(const query::Predicate<T>& predicate, std::optional<T>* out) const noexcept {
            if (out == nullptr) {
                return invalid("out cannot be null");
            }
            std::optional<mapper::Record> record;
            core::Status s = find_first(predicate.filter(), mapper::type_name_of<T>(), &record);
            if (!core::is_ok(s)) {
                return s;
            }
            if (!record) {
                out->reset();
                return core::ok_status();
            }
            T doc{};
            s = mapper::from_record(*record, &doc);
            if (!core::is_ok(s)) {
                return s;
            }
            *out = std::move(doc);
            return core::ok_status();
        }

        template <typename T>
        [[nodiscard]] core::Status delete_by_id(std::string_view id) const noexcept {
            T existing{};
            core::Status s = get_by_id<T>(id, &existing);
            if (!core::is_ok(s)) {
                return s;
            }
            return remove_record(id);
        }

        template <typename T>
        [[nodiscard]] core::Status list(i64 page,
            i64 page_size,
            std::string_view sort_key,
            const query::Predicate<T>& predicate,
            Page<T>* out) const noexcept {
            if (out == nullptr) {
                return invalid("out cannot be null");
            }
            core::Status s = validate_page_request(page, page_size, sort_key);
            if (!core::is_ok(s)) {
                return s;
            }

            query::SortSpec sort;
            s = query::parse_sort_key(sort_key, &sort);
            if (!core::is_ok(s)) {
                return s;
            }
            sort.field = resolve_sort_field<T>(sort.field);

            RecordPage records;
            s = list_records(predicate.filter(), mapper::type_name_of<T>(), sort, page, page_size, &records);
            if (!core::is_ok(s)) {
                return s;
            }

            Page<T> result;
            result.total_count = records.total_count;
            result.total_pages = records.total_pages;
            result.data.reserve(records.records.size());
            for (const mapper::Record& record : records.records) {
                T doc{};
                s = mapper::from_record(record, &doc);
                if (!core::is_ok(s)) {
                    return s;
                }
                result.data.push_back(std::move(doc));
            }
            *out = std::move(result);
            return core::ok_status();
        }

    private:
        [[nodiscard]] static core::Status invalid(const char* message) noexcept;

        [[nodiscard]] core::Status save_record(mapper::Record record, std::string_view type_name) const noexcept;
        [[nodiscard]] core::Status read_record(std::string_view id, mapper::Record* out) const noexcept;
        [[nodiscard]] core::Status find_first(const query::Filter& filter,
            std::string_view type_name,
            std::optional<mapper::Record>* out) const noexcept;
        [[nodiscard]] core::Status list_records(const query::Filter& filter,
            std::string_view type_name,
            const query::SortSpec& sort,
            i64 page,
            i64 page_size,
            RecordPage* out) const noexcept;
        [[nodiscard]] core::Status remove_record(std::string_view id) const noexcept;

        config::ClientConfig cfg_;
        tenancy::TenancyScoper scoper_;
        std::shared_ptr<store::DocumentStore> store_;
        PaginationEngine pagination_;
    };

} // namespace docscope::client
