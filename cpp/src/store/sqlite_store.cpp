#include "docscope/store/sqlite_store.hpp"

#include <sqlite3.h>
#include <cstdlib>
#include <cstring>
#include <string>

#include <spdlog/spdlog.h>

#include "docscope/core/text.hpp"

namespace docscope::store {

using namespace docscope::core;

namespace {
    [[nodiscard]] StatusCode code_for(int rc) noexcept {
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return StatusCode::Busy;
            case SQLITE_CONSTRAINT:
                return StatusCode::Conflict;
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_CANTOPEN:
            case SQLITE_READONLY:
                return StatusCode::Io;
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
                return StatusCode::Corrupt;
            default:
                return StatusCode::Unknown;
        }
    }

    [[nodiscard]] Status sqlite_error(sqlite3* db, int rc, const char* context) noexcept {
        const int extended = db ? sqlite3_extended_errcode(db) : rc;
        std::string message = context;
        message += ": ";
        message += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        spdlog::error("sqlite store: {} (rc={})", message, extended);
        return make_status(StatusDomain::Store, code_for(rc), std::move(message), static_cast<u32>(extended));
    }

    [[nodiscard]] Status invalid(std::string message) noexcept {
        return make_status(StatusDomain::Store, StatusCode::Invalid, std::move(message));
    }

    [[nodiscard]] std::string quote_identifier(std::string_view name) {
        std::string out = "\"";
        for (char c : name) {
            if (c == '"') {
                out += '"';
            }
            out += c;
        }
        out += '"';
        return out;
    }

    // RAII over a prepared statement.
    class Statement {
    public:
        Statement() = default;
        ~Statement() {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
        }
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        [[nodiscard]] int prepare(sqlite3* db, std::string_view sql, const char** tail = nullptr) noexcept {
            return sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, tail);
        }

        [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

    private:
        sqlite3_stmt* stmt_{nullptr};
    };

    [[nodiscard]] bool only_trailing_noise(const char* tail, const char* end) noexcept {
        for (const char* p = tail; p != nullptr && p < end; ++p) {
            if (*p != ';' && *p != ' ' && *p != '\n' && *p != '\t' && *p != '\r') {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] Record column_value(sqlite3_stmt* stmt, int col) {
        switch (sqlite3_column_type(stmt, col)) {
            case SQLITE_INTEGER:
                return Record(static_cast<i64>(sqlite3_column_int64(stmt, col)));
            case SQLITE_FLOAT:
                return Record(sqlite3_column_double(stmt, col));
            case SQLITE_TEXT: {
                const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
                const int len = sqlite3_column_bytes(stmt, col);
                return Record(std::string(text ? text : "", text ? static_cast<size_t>(len) : 0));
            }
            default:
                return Record(nullptr);
        }
    }

    [[nodiscard]] Status parse_body(const char* text, int len, Record* out) noexcept {
        try {
            *out = Record::parse(std::string(text ? text : "", text ? static_cast<size_t>(len) : 0));
        } catch (const nlohmann::json::exception& e) {
            return make_status(StatusDomain::Store, StatusCode::Corrupt,
                std::string("stored body is not valid JSON: ") + e.what());
        }
        if (!out->is_object()) {
            return make_status(StatusDomain::Store, StatusCode::Corrupt, "stored body is not a JSON object");
        }
        return ok_status();
    }

    [[nodiscard]] Status exec(sqlite3* db, const std::string& sql, const char* context) noexcept {
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        if (rc != SQLITE_OK) {
            return sqlite_error(db, rc, context);
        }
        return ok_status();
    }
} // namespace

SqliteStoreOptions sqlite_options_from_config(const config::ClientConfig& cfg) {
    SqliteStoreOptions opts;
    opts.path = cfg.endpoint;
    opts.collection = cfg.collection_id;
    return opts;
}

// ============================================================================
// Lifecycle
// ============================================================================

SqliteDocumentStore::SqliteDocumentStore(OpenKey, sqlite3* db, std::string collection)
    : db_(db), collection_(std::move(collection)), table_(quote_identifier(collection_)) {}

SqliteDocumentStore::~SqliteDocumentStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Status SqliteDocumentStore::open(const SqliteStoreOptions& opts, std::shared_ptr<SqliteDocumentStore>* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }
    if (is_blank(opts.path)) {
        return invalid("path cannot be null or empty");
    }
    if (is_blank(opts.collection)) {
        return invalid("collection cannot be null or empty");
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(opts.path.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        Status s = sqlite_error(db, rc, "open");
        sqlite3_close(db);
        return s;
    }

    // From here on the store owns the connection.
    auto store = std::make_shared<SqliteDocumentStore>(OpenKey{}, db, opts.collection);

    const char* journal_mode = std::getenv("DOCSCOPE_SQLITE_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    // In-memory databases refuse WAL; that is not an error.
    if (!is_ok(exec(db, std::string("PRAGMA journal_mode=") + journal_mode, "journal_mode"))) {
        spdlog::debug("sqlite store: journal_mode={} not applied to {}", journal_mode, opts.path);
    }
    (void)exec(db, "PRAGMA synchronous=NORMAL", "synchronous");
    (void)exec(db, "PRAGMA temp_store=MEMORY", "temp_store");

    Status s = exec(db, "SELECT json_extract('{\"a\":1}', '$.a')", "json1 probe");
    if (!is_ok(s)) {
        return make_status(StatusDomain::Store, StatusCode::Unsupported,
            "sqlite was built without the JSON1 functions", s.aux);
    }

    s = exec(db,
        "CREATE TABLE IF NOT EXISTS " + store->table_ + " (id TEXT PRIMARY KEY, body TEXT NOT NULL)",
        "create collection");
    if (!is_ok(s)) {
        return s;
    }

    spdlog::info("sqlite store: opened {} collection {}", opts.path, opts.collection);
    *out = std::move(store);
    return ok_status();
}

// ============================================================================
// Operations
// ============================================================================

Status SqliteDocumentStore::query(std::string_view text, std::vector<Record>* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }
    if (is_blank(text)) {
        return invalid("query text cannot be null or empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt;
    const char* tail = nullptr;
    int rc = stmt.prepare(db_, text, &tail);
    if (rc != SQLITE_OK) {
        return sqlite_error(db_, rc, "prepare query");
    }
    if (stmt.get() == nullptr || !only_trailing_noise(tail, text.data() + text.size())) {
        return invalid("query text must be exactly one statement");
    }
    if (!sqlite3_stmt_readonly(stmt.get())) {
        return invalid("query text must be read-only");
    }

    const int columns = sqlite3_column_count(stmt.get());
    std::vector<Record> rows;

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Record rec = Record::object();
        for (int col = 0; col < columns; ++col) {
            if (std::strcmp(sqlite3_column_name(stmt.get(), col), "body") != 0) {
                continue;
            }
            Record body;
            Status s = parse_body(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), col)),
                sqlite3_column_bytes(stmt.get(), col), &body);
            if (!is_ok(s)) {
                return s;
            }
            rec = std::move(body);
        }
        for (int col = 0; col < columns; ++col) {
            const char* name = sqlite3_column_name(stmt.get(), col);
            if (std::strcmp(name, "body") == 0) {
                continue;
            }
            rec[name] = column_value(stmt.get(), col);
        }
        rows.push_back(std::move(rec));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, rc, "step query");
    }

    out->insert(out->end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    return ok_status();
}

Status SqliteDocumentStore::upsert(const Record& record) noexcept {
    if (!record.is_object()) {
        return invalid("record must be an object");
    }
    const auto id = record.find(std::string(kStoreIdField));
    if (id == record.end() || !id->is_string() || is_blank(id->get_ref<const std::string&>())) {
        return invalid("record id cannot be null or empty");
    }

    std::string body;
    try {
        body = record.dump();
    } catch (const nlohmann::json::exception& e) {
        return make_status(StatusDomain::Store, StatusCode::Corrupt, std::string("cannot encode record: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt;
    int rc = stmt.prepare(db_, "INSERT OR REPLACE INTO " + table_ + " (id, body) VALUES (?, ?)");
    if (rc != SQLITE_OK) {
        return sqlite_error(db_, rc, "prepare upsert");
    }

    const std::string& key = id->get_ref<const std::string&>();
    sqlite3_bind_text(stmt.get(), 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, body.data(), static_cast<int>(body.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, rc, "upsert");
    }
    return ok_status();
}

Status SqliteDocumentStore::read_by_id(std::string_view id, Record* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt;
    int rc = stmt.prepare(db_, "SELECT body FROM " + table_ + " WHERE id = ?");
    if (rc != SQLITE_OK) {
        return sqlite_error(db_, rc, "prepare read");
    }
    sqlite3_bind_text(stmt.get(), 1, id.data(), static_cast<int>(id.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Store, StatusCode::NotFound, "Resource Not Found");
    }
    if (rc != SQLITE_ROW) {
        return sqlite_error(db_, rc, "read");
    }

    Record body;
    Status s = parse_body(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)),
        sqlite3_column_bytes(stmt.get(), 0), &body);
    if (!is_ok(s)) {
        return s;
    }
    body[std::string(kStoreIdField)] = std::string(id);
    *out = std::move(body);
    return ok_status();
}

Status SqliteDocumentStore::delete_by_id(std::string_view id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt;
    int rc = stmt.prepare(db_, "DELETE FROM " + table_ + " WHERE id = ?");
    if (rc != SQLITE_OK) {
        return sqlite_error(db_, rc, "prepare delete");
    }
    sqlite3_bind_text(stmt.get(), 1, id.data(), static_cast<int>(id.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, rc, "delete");
    }
    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Store, StatusCode::NotFound, "Resource Not Found");
    }
    return ok_status();
}

Status SqliteDocumentStore::count(u64* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt;
    int rc = stmt.prepare(db_, "SELECT COUNT(*) FROM " + table_);
    if (rc != SQLITE_OK) {
        return sqlite_error(db_, rc, "prepare count");
    }
    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        return sqlite_error(db_, rc, "count");
    }
    *out = static_cast<u64>(sqlite3_column_int64(stmt.get(), 0));
    return ok_status();
}

} // namespace docscope::store
