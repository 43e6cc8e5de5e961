#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "docscope/config/config.hpp"
#include "docscope/store/document_store.hpp"

struct sqlite3;

namespace docscope::store {

    struct SqliteStoreOptions {
        std::string path{":memory:"};        // file path, ":memory:" or a "file:" URI
        std::string collection{"documents"}; // table holding the collection
    };

    // Endpoint is the database path, collection_id the table.
    [[nodiscard]] SqliteStoreOptions sqlite_options_from_config(const config::ClientConfig& cfg);

    // Document store over one SQLite table (id TEXT PRIMARY KEY, body TEXT)
    // with bodies queried through the JSON1 functions. Query text is SQL as
    // produced by docscope::query::render; it must be a single read-only
    // statement. A `body` result column becomes the record, any other column
    // a member of it.
    //
    // Journal mode comes from DOCSCOPE_SQLITE_JOURNAL_MODE (default WAL).
    class SqliteDocumentStore final : public DocumentStore {
        struct OpenKey {
            explicit OpenKey() = default;
        };

    public:
        // Reachable only through open(); takes ownership of db.
        SqliteDocumentStore(OpenKey, sqlite3* db, std::string collection);

        [[nodiscard]] static core::Status open(const SqliteStoreOptions& opts,
            std::shared_ptr<SqliteDocumentStore>* out) noexcept;

        ~SqliteDocumentStore() override;

        SqliteDocumentStore(const SqliteDocumentStore&) = delete;
        SqliteDocumentStore& operator=(const SqliteDocumentStore&) = delete;

        [[nodiscard]] core::Status query(std::string_view text, std::vector<Record>* out) noexcept override;
        [[nodiscard]] core::Status upsert(const Record& record) noexcept override;
        [[nodiscard]] core::Status read_by_id(std::string_view id, Record* out) noexcept override;
        [[nodiscard]] core::Status delete_by_id(std::string_view id) noexcept override;

        // Number of rows in the collection table.
        [[nodiscard]] core::Status count(core::u64* out) noexcept;

        [[nodiscard]] const std::string& collection() const noexcept override { return collection_; }

    private:
        sqlite3* db_{nullptr};
        std::string collection_;
        std::string table_; // quoted table identifier
        std::mutex mutex_;
    };

} // namespace docscope::store
