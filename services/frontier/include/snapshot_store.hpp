#pragma once
#include "state_store.hpp"
#include <map>
#include <mutex>

// Fallback backend: an in-memory ordered map mirrored to <dir>/frontier.jsonl.
//
// Every successful write rewrites the whole snapshot (temp file, fsync, rename,
// then a directory fsync), so each mutation costs O(total records). Intended as a safety net when the
// SQLite engine cannot be used, not as a scalable store.
//
// Line format, one JSON object per line:
//   {"status":"pending","key":"q:...","item":{...}}
//   {"status":"processing"|"completed"|"failed","item":{...}}
//   {"status":"seen","fingerprint":"..."}
//   {"status":"raw","key":"...","value":"..."}   anything else, e.g. orphans
//                                                or unreadable item bodies
// Keys and values are expected to be valid UTF-8.
class SnapshotStore : public StateStore {
public:
    explicit SnapshotStore(const std::filesystem::path& dir);
    ~SnapshotStore() override;

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    std::vector<KeyValue> scan(const std::string& prefix, std::size_t limit = 0,
                               const std::string& start_after = {}) const override;
    std::size_t count(const std::string& prefix) const override;
    bool write(const WriteBatch& batch) override;
    void clear() override;
    void close() override;
    std::string backend_id() const override { return "snapshot"; }

    const std::filesystem::path& snapshot_path() const { return snapshot_path_; }

private:
    void load();
    void load_line(const std::string& line);
    std::string render_locked() const;
    void persist_locked() const;
    void sync_directory() const;
    std::optional<std::string> lookup(const std::string& key) const;
    void ensure_open() const;

    DirectoryLock lock_;
    std::filesystem::path snapshot_path_;
    mutable std::mutex mu_;
    std::map<std::string, std::string> data_;
    bool open_{true};
};
