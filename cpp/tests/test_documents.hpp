#pragma once

#include <cstdio>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "docscope/config/config.hpp"
#include "docscope/mapper/document.hpp"
#include "docscope/store/document_store.hpp"
#include "docscope/store/sqlite_store.hpp"

namespace docscope_test {

struct TestObject {
    std::string id;
    int age{0};
    std::string first_name;
    std::vector<std::string> aliases;
    std::string entity_type;
};

// Same shape without the tag member.
struct TestObjectNoEntityType {
    std::string id;
    int age{0};
    std::string first_name;
    std::vector<std::string> aliases;
};

struct Account {
    std::string id;
    double balance{0.0};
    bool active{false};
    std::string created_by; // read-only once stored
};

inline std::string make_id() {
    static int counter = 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "doc-%06d", ++counter);
    return buf;
}

inline TestObject make_test_object(int age = 42, std::string first_name = "Ada") {
    TestObject t;
    t.id = make_id();
    t.age = age;
    t.first_name = std::move(first_name);
    t.aliases = {"Alias One", "Alias Two", "Alias Three"};
    return t;
}

inline docscope::config::ClientConfig make_config(std::string namespace_name = {}) {
    docscope::config::ClientConfig cfg;
    cfg.endpoint = ":memory:";
    cfg.auth_key = "C2y6yDjf5/R+ob0N8A7Cgv30VRDJIWEHLM+4QDU5DE2nQ9nDuVTqobD4b8mGGyPMbIZnqyMsEcaGQy67XIw/Jw==";
    cfg.database_id = "testing";
    cfg.collection_id = "default";
    cfg.preferred_locations = {""};
    cfg.namespace_name = std::move(namespace_name);
    return cfg;
}

// Fresh in-memory store; null on failure.
inline std::shared_ptr<docscope::store::SqliteDocumentStore> open_memory_store(std::string collection = "default") {
    docscope::store::SqliteStoreOptions opts;
    opts.collection = std::move(collection);
    std::shared_ptr<docscope::store::SqliteDocumentStore> store;
    if (!docscope::core::is_ok(docscope::store::SqliteDocumentStore::open(opts, &store))) {
        return nullptr;
    }
    return store;
}

// Forwards to another store, counting calls and recording query texts.
// Setting fail_query_at to n makes the n-th query fail with Unavailable.
class CountingStore final : public docscope::store::DocumentStore {
public:
    explicit CountingStore(std::shared_ptr<docscope::store::DocumentStore> inner) : inner_(std::move(inner)) {}

    const std::string& collection() const noexcept override { return inner_->collection(); }

    docscope::core::Status query(std::string_view text, std::vector<docscope::store::Record>* out) noexcept override {
        ++queries;
        texts.emplace_back(text);
        if (fail_query_at != 0 && queries == fail_query_at) {
            return docscope::core::make_status(docscope::core::StatusDomain::Store,
                docscope::core::StatusCode::Unavailable, "injected failure");
        }
        return inner_->query(text, out);
    }

    docscope::core::Status upsert(const docscope::store::Record& record) noexcept override {
        ++upserts;
        return inner_->upsert(record);
    }

    docscope::core::Status read_by_id(std::string_view id, docscope::store::Record* out) noexcept override {
        ++reads;
        return inner_->read_by_id(id, out);
    }

    docscope::core::Status delete_by_id(std::string_view id) noexcept override {
        ++deletes;
        return inner_->delete_by_id(id);
    }

    int queries{0};
    int upserts{0};
    int reads{0};
    int deletes{0};
    int fail_query_at{0};
    std::vector<std::string> texts;

private:
    std::shared_ptr<docscope::store::DocumentStore> inner_;
};

} // namespace docscope_test

namespace docscope::mapper {

template <>
struct DocumentTraits<docscope_test::TestObject> {
    static constexpr std::string_view type_name = "TestObject";
    static constexpr auto fields = std::make_tuple(
        field("Id", &docscope_test::TestObject::id),
        field("Age", &docscope_test::TestObject::age),
        field("FirstName", &docscope_test::TestObject::first_name),
        field("Aliases", &docscope_test::TestObject::aliases),
        field("EntityType", &docscope_test::TestObject::entity_type));
};

template <>
struct DocumentTraits<docscope_test::TestObjectNoEntityType> {
    static constexpr std::string_view type_name = "TestObjectNoEntityType";
    static constexpr auto fields = std::make_tuple(
        field("Id", &docscope_test::TestObjectNoEntityType::id),
        field("Age", &docscope_test::TestObjectNoEntityType::age),
        field("FirstName", &docscope_test::TestObjectNoEntityType::first_name),
        field("Aliases", &docscope_test::TestObjectNoEntityType::aliases));
};

template <>
struct DocumentTraits<docscope_test::Account> {
    static constexpr std::string_view type_name = "Account";
    static constexpr auto fields = std::make_tuple(
        field("Id", &docscope_test::Account::id),
        field("Balance", &docscope_test::Account::balance),
        field("Active", &docscope_test::Account::active),
        field("CreatedBy", &docscope_test::Account::created_by, FieldAccess::ReadOnly));
};

} // namespace docscope::mapper
