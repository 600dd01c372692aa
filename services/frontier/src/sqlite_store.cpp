#include "sqlite_store.hpp"
#include <sqlite3.h>
#include <iostream>

namespace fs = std::filesystem;

namespace {

void bind_blob(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

std::string column_string(sqlite3_stmt* st, int col) {
    const void* p = sqlite3_column_blob(st, col);
    int n = sqlite3_column_bytes(st, col);
    if (!p || n <= 0) return {};
    return std::string(static_cast<const char*>(p), static_cast<std::size_t>(n));
}

// Resets the statement on entry and exit so bindings never leak between calls.
struct StatementScope {
    sqlite3_stmt* st;
    explicit StatementScope(sqlite3_stmt* s) : st(s) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
    ~StatementScope() { sqlite3_reset(st); }
};

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

// Rolls back unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec_sql(db_, "BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (committed_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[frontier] sqlite rollback failed: " << (err ? err : "unknown") << std::endl;
            sqlite3_free(err);
        }
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_{false};
};

}  // namespace

SqliteStore::SqliteStore(const fs::path& dir)
    : lock_(dir), db_path_(dir / "frontier.db" / "state.sqlite3") {
    std::error_code ec;
    fs::create_directories(db_path_.parent_path(), ec);
    if (ec) throw StoreError("cannot create " + db_path_.parent_path().string() + ": " + ec.message());

    if (sqlite3_open_v2(db_path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open SQLite DB " + db_path_.string() + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    std::cout << "[frontier] sqlite store opened at " << db_path_.string() << std::endl;
}

SqliteStore::~SqliteStore() {
    close();
}

void SqliteStore::init() {
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec("CREATE TABLE IF NOT EXISTS kv (\n"
         "  k BLOB PRIMARY KEY,\n"
         "  v BLOB NOT NULL\n"
         ") WITHOUT ROWID;");
}

void SqliteStore::exec(const std::string& sql) {
    exec_sql(db_, sql.c_str());
}

void SqliteStore::prepare_statements() {
    struct Spec {
        sqlite3_stmt** out;
        const char* sql;
    };
    const Spec specs[] = {
        {&get_stmt_, "SELECT v FROM kv WHERE k = ?1;"},
        {&put_stmt_, "INSERT OR REPLACE INTO kv (k, v) VALUES (?1, ?2);"},
        {&delete_stmt_, "DELETE FROM kv WHERE k = ?1;"},
        {&scan_range_stmt_, "SELECT k, v FROM kv WHERE k >= ?1 AND k < ?2 ORDER BY k LIMIT ?3;"},
        {&scan_tail_stmt_, "SELECT k, v FROM kv WHERE k >= ?1 ORDER BY k LIMIT ?3;"},
        {&count_range_stmt_, "SELECT COUNT(*) FROM kv WHERE k >= ?1 AND k < ?2;"},
        {&count_tail_stmt_, "SELECT COUNT(*) FROM kv WHERE k >= ?1;"},
    };
    for (const auto& s : specs) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.out, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }
}

void SqliteStore::close_statements() {
    for (sqlite3_stmt** st : {&get_stmt_, &put_stmt_, &delete_stmt_, &scan_range_stmt_,
                              &scan_tail_stmt_, &count_range_stmt_, &count_tail_stmt_}) {
        if (*st) {
            sqlite3_finalize(*st);
            *st = nullptr;
        }
    }
}

void SqliteStore::ensure_open() const {
    if (!db_) throw StoreError("sqlite store is closed");
}

void SqliteStore::step_done(sqlite3_stmt* st, const char* what) {
    if (sqlite3_step(st) != SQLITE_DONE) {
        throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
    }
}

std::optional<std::string> SqliteStore::get_locked(const std::string& key) const {
    StatementScope scope(get_stmt_);
    bind_blob(get_stmt_, 1, key);
    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_ROW) return column_string(get_stmt_, 0);
    if (rc == SQLITE_DONE) return std::nullopt;
    throw StoreError(std::string("get failed: ") + sqlite3_errmsg(db_));
}

std::optional<std::string> SqliteStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    return get_locked(key);
}

void SqliteStore::put(const std::string& key, const std::string& value) {
    WriteBatch batch;
    batch.put(key, value);
    write(batch);
}

void SqliteStore::remove(const std::string& key) {
    WriteBatch batch;
    batch.remove(key);
    write(batch);
}

std::vector<KeyValue> SqliteStore::scan(const std::string& prefix, std::size_t limit,
                                        const std::string& start_after) const {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();

    // Smallest key strictly greater than start_after is start_after + '\0'.
    std::string lower = prefix;
    if (!start_after.empty() && start_after >= prefix) lower = start_after + std::string(1, '\0');
    const std::string upper = prefix_upper_bound(prefix);

    sqlite3_stmt* st = upper.empty() ? scan_tail_stmt_ : scan_range_stmt_;
    StatementScope scope(st);
    bind_blob(st, 1, lower);
    if (!upper.empty()) bind_blob(st, 2, upper);
    sqlite3_bind_int64(st, 3, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

    std::vector<KeyValue> out;
    for (;;) {
        int rc = sqlite3_step(st);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) throw StoreError(std::string("scan failed: ") + sqlite3_errmsg(db_));
        out.push_back({column_string(st, 0), column_string(st, 1)});
    }
    return out;
}

std::size_t SqliteStore::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    const std::string upper = prefix_upper_bound(prefix);
    sqlite3_stmt* st = upper.empty() ? count_tail_stmt_ : count_range_stmt_;
    StatementScope scope(st);
    bind_blob(st, 1, prefix);
    if (!upper.empty()) bind_blob(st, 2, upper);
    if (sqlite3_step(st) != SQLITE_ROW) throw StoreError(std::string("count failed: ") + sqlite3_errmsg(db_));
    return static_cast<std::size_t>(sqlite3_column_int64(st, 0));
}

bool SqliteStore::write(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    Transaction txn(db_);
    if (!batch.guards_hold([this](const std::string& k) { return get_locked(k); })) {
        return false;
    }
    for (const auto& op : batch.ops()) {
        if (op.kind == WriteBatch::OpKind::Put) {
            StatementScope scope(put_stmt_);
            bind_blob(put_stmt_, 1, op.key);
            bind_blob(put_stmt_, 2, op.value);
            step_done(put_stmt_, "put");
        } else {
            StatementScope scope(delete_stmt_);
            bind_blob(delete_stmt_, 1, op.key);
            step_done(delete_stmt_, "delete");
        }
    }
    txn.commit();
    return true;
}

void SqliteStore::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    Transaction txn(db_);
    exec("DELETE FROM kv;");
    txn.commit();
}

void SqliteStore::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        close_statements();
        if (sqlite3_close(db_) != SQLITE_OK) {
            std::cerr << "[frontier] sqlite close failed: " << sqlite3_errmsg(db_) << std::endl;
        }
        db_ = nullptr;
    }
    lock_.release();
}
