#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Bad path, locked directory, or no usable backend. Raised at open time.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// I/O or engine failure. The failed write left no partial change behind.
struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct KeyValue {
    std::string key;
    std::string value;
};

// Puts and deletes applied all-or-nothing. Guards are checked inside the same
// critical section as the apply; a failed guard commits nothing.
class WriteBatch {
public:
    enum class OpKind { Put, Delete };
    struct Op {
        OpKind kind;
        std::string key;
        std::string value;
    };

    enum class GuardKind { Present, Absent, Equals };
    struct Guard {
        GuardKind kind;
        std::string key;
        std::string value;
    };

    void put(std::string key, std::string value);
    void remove(std::string key);

    void expect_present(std::string key);
    void expect_absent(std::string key);
    void expect_value(std::string key, std::string value);

    bool empty() const { return ops_.empty(); }
    const std::vector<Op>& ops() const { return ops_; }
    const std::vector<Guard>& guards() const { return guards_; }

    // True when every guard holds against `current`.
    template <typename Lookup>
    bool guards_hold(Lookup&& current) const {
        for (const auto& g : guards_) {
            std::optional<std::string> v = current(g.key);
            switch (g.kind) {
            case GuardKind::Present: if (!v) return false; break;
            case GuardKind::Absent: if (v) return false; break;
            case GuardKind::Equals: if (!v || *v != g.value) return false; break;
            }
        }
        return true;
    }

private:
    std::vector<Op> ops_;
    std::vector<Guard> guards_;
};

// Ordered key-value store. Keys compare as raw bytes.
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;

    // Keys starting with `prefix` in ascending order, strictly after
    // `start_after` when given. limit 0 means unlimited.
    virtual std::vector<KeyValue> scan(const std::string& prefix, std::size_t limit = 0,
                                       const std::string& start_after = {}) const = 0;
    virtual std::size_t count(const std::string& prefix) const = 0;

    // Returns false (and changes nothing) when a guard fails.
    // Throws StoreError on I/O failure, also without changing anything.
    virtual bool write(const WriteBatch& batch) = 0;

    virtual void clear() = 0;
    virtual void close() = 0;
    virtual std::string backend_id() const = 0;
};

// Exclusive advisory lock on <dir>/LOCK, held for the lifetime of the object.
class DirectoryLock {
public:
    explicit DirectoryLock(const std::filesystem::path& dir);
    ~DirectoryLock();
    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;

    void release();

private:
    int fd_{-1};
};

enum class StoreBackend { Auto, Sqlite, Snapshot };

StoreBackend parse_backend(const std::string& name);
const char* backend_name(StoreBackend backend);

// Creates `dir` if missing. Auto opens SQLite and falls back to the snapshot
// store when SQLite cannot be opened. Throws ConfigError when nothing opens.
std::unique_ptr<StateStore> open_state_store(const std::filesystem::path& dir, StoreBackend backend);

// Smallest string greater than every string starting with `prefix`;
// empty when no such bound exists.
std::string prefix_upper_bound(const std::string& prefix);
