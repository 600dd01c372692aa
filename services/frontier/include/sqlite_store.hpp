#pragma once
#include "state_store.hpp"
#include <mutex>

// Primary backend: one WITHOUT ROWID table keyed by BLOB, which SQLite keeps
// as a memcmp-ordered B-tree. Every batch is a BEGIN IMMEDIATE transaction.
// Lives in <dir>/frontier.db/state.sqlite3.
class SqliteStore : public StateStore {
public:
    explicit SqliteStore(const std::filesystem::path& dir);
    ~SqliteStore() override;

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    std::vector<KeyValue> scan(const std::string& prefix, std::size_t limit = 0,
                               const std::string& start_after = {}) const override;
    std::size_t count(const std::string& prefix) const override;
    bool write(const WriteBatch& batch) override;
    void clear() override;
    void close() override;
    std::string backend_id() const override { return "sqlite"; }

    const std::filesystem::path& db_path() const { return db_path_; }

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    void ensure_open() const;
    std::optional<std::string> get_locked(const std::string& key) const;
    void step_done(struct sqlite3_stmt* st, const char* what);

    DirectoryLock lock_;
    std::filesystem::path db_path_;
    mutable std::mutex mu_;

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* get_stmt_ {nullptr};
    struct sqlite3_stmt* put_stmt_ {nullptr};
    struct sqlite3_stmt* delete_stmt_ {nullptr};
    struct sqlite3_stmt* scan_range_stmt_ {nullptr};
    struct sqlite3_stmt* scan_tail_stmt_ {nullptr};
    struct sqlite3_stmt* count_range_stmt_ {nullptr};
    struct sqlite3_stmt* count_tail_stmt_ {nullptr};
};
