#include "snapshot_store.hpp"
#include "crawl_item.hpp"
#include "queue_key.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <set>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

struct StatusPrefix {
    const char* status;
    const std::string* prefix;
};

const StatusPrefix kStatePrefixes[] = {
    {"processing", &kProcessingPrefix},
    {"completed", &kCompletedPrefix},
    {"failed", &kFailedPrefix},
};

// True when `body` is an item object whose item_id matches the key suffix, so a
// reload can rebuild the key from the record alone.
bool is_item_body(const std::string& body, const std::string& id) {
    json j = json::parse(body, nullptr, false);
    if (!j.is_object()) return false;
    auto it = j.find("item_id");
    return it != j.end() && it->is_string() && it->get<std::string>() == id;
}

void append_item_record(std::string& out, const char* status, const std::string& body) {
    out += "{\"status\":\"";
    out += status;
    out += "\",\"item\":";
    out += body;
    out += "}\n";
}

}  // namespace

SnapshotStore::SnapshotStore(const fs::path& dir)
    : lock_(dir), snapshot_path_(dir / "frontier.jsonl") {
    load();
    std::cerr << "[frontier] snapshot store at " << snapshot_path_.string()
              << ": every mutation rewrites the full snapshot (O(total items) per write)" << std::endl;
}

SnapshotStore::~SnapshotStore() {
    close();
}

void SnapshotStore::load() {
    if (!fs::exists(snapshot_path_)) return;
    std::ifstream f(snapshot_path_);
    if (!f) throw StoreError("cannot read snapshot " + snapshot_path_.string());
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            load_line(line);
        } catch (const std::exception& e) {
            std::cerr << "[frontier] skipping malformed snapshot line " << line_no << ": " << e.what() << std::endl;
        }
    }
    if (f.bad()) throw StoreError("error reading snapshot " + snapshot_path_.string());
}

void SnapshotStore::load_line(const std::string& line) {
    auto j = json::parse(line);
    const std::string status = j.at("status").get<std::string>();

    if (status == "pending") {
        const json& body = j.at("item");
        const std::string id = body.at("item_id").get<std::string>();
        std::string key = j.contains("key") ? j["key"].get<std::string>() : queue_key(body.get<CrawlItem>());
        data_[key] = id;
        data_[item_key(id)] = body.dump();
        return;
    }
    for (const auto& sp : kStatePrefixes) {
        if (status == sp.status) {
            const json& body = j.at("item");
            data_[*sp.prefix + body.at("item_id").get<std::string>()] = body.dump();
            return;
        }
    }
    if (status == "seen") {
        data_[seen_key(j.at("fingerprint").get<std::string>())] = "1";
    } else if (status == "raw") {
        data_[j.at("key").get<std::string>()] = j.at("value").get<std::string>();
    } else {
        throw std::invalid_argument("unknown status '" + status + "'");
    }
}

std::string SnapshotStore::render_locked() const {
    std::set<std::string> pending_ids;
    for (auto it = data_.lower_bound(kQueuePrefix); it != data_.end() && starts_with(it->first, kQueuePrefix); ++it) {
        auto body = data_.find(item_key(it->second));
        if (body != data_.end() && is_item_body(body->second, it->second)) pending_ids.insert(it->second);
    }

    std::string out;
    auto raw = [&out](const std::string& k, const std::string& v) {
        out += json{{"status", "raw"}, {"key", k}, {"value", v}}.dump();
        out += '\n';
    };

    for (const auto& [key, value] : data_) {
        if (starts_with(key, kQueuePrefix)) {
            // Orphans and unreadable bodies are kept verbatim as raw records.
            if (!pending_ids.count(value)) {
                raw(key, value);
                continue;
            }
            out += "{\"status\":\"pending\",\"key\":" + json(key).dump() + ",\"item\":" + data_.at(item_key(value)) + "}\n";
            continue;
        }
        if (starts_with(key, kItemPrefix)) {
            // Pending bodies travel with their queue record.
            if (!pending_ids.count(key.substr(kItemPrefix.size()))) raw(key, value);
            continue;
        }
        if (starts_with(key, kSeenPrefix)) {
            out += json{{"status", "seen"}, {"fingerprint", key.substr(kSeenPrefix.size())}}.dump();
            out += '\n';
            continue;
        }
        bool written = false;
        for (const auto& sp : kStatePrefixes) {
            if (starts_with(key, *sp.prefix)) {
                if (is_item_body(value, key.substr(sp.prefix->size()))) {
                    append_item_record(out, sp.status, value);
                    written = true;
                }
                break;
            }
        }
        if (!written) raw(key, value);
    }
    return out;
}

void SnapshotStore::persist_locked() const {
    const std::string data = render_locked();
    const fs::path tmp = snapshot_path_.string() + ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw StoreError("cannot open " + tmp.string() + " for writing: " + std::strerror(errno));
    auto abandon = [&](const std::string& what) {
        int err = errno;
        ::close(fd);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return StoreError(what + " " + tmp.string() + ": " + std::strerror(err));
    };
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw abandon("short write to");
        }
        written += static_cast<std::size_t>(n);
    }
    // The rename below must never expose a file whose contents are not on disk.
    if (::fsync(fd) != 0) throw abandon("fsync failed for");
    if (::close(fd) != 0) {
        int err = errno;
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StoreError("close failed for " + tmp.string() + ": " + std::strerror(err));
    }

    std::error_code ec;
    fs::rename(tmp, snapshot_path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StoreError("cannot replace " + snapshot_path_.string() + ": " + ec.message());
    }
    sync_directory();
}

// Runs after the rename has replaced the snapshot, so a failure here cannot be
// rolled back; it only weakens durability of the new directory entry.
void SnapshotStore::sync_directory() const {
    const fs::path dir = snapshot_path_.parent_path();
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        std::cerr << "[frontier] cannot open " << dir.string() << " to sync: " << std::strerror(errno) << std::endl;
        return;
    }
    if (::fsync(dfd) != 0) {
        std::cerr << "[frontier] fsync failed for " << dir.string() << ": " << std::strerror(errno) << std::endl;
    }
    ::close(dfd);
}

std::optional<std::string> SnapshotStore::lookup(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void SnapshotStore::ensure_open() const {
    if (!open_) throw StoreError("snapshot store is closed");
}

std::optional<std::string> SnapshotStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    return lookup(key);
}

void SnapshotStore::put(const std::string& key, const std::string& value) {
    WriteBatch batch;
    batch.put(key, value);
    write(batch);
}

void SnapshotStore::remove(const std::string& key) {
    WriteBatch batch;
    batch.remove(key);
    write(batch);
}

std::vector<KeyValue> SnapshotStore::scan(const std::string& prefix, std::size_t limit,
                                          const std::string& start_after) const {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    auto it = (!start_after.empty() && start_after >= prefix) ? data_.upper_bound(start_after)
                                                              : data_.lower_bound(prefix);
    std::vector<KeyValue> out;
    for (; it != data_.end() && starts_with(it->first, prefix); ++it) {
        if (limit != 0 && out.size() >= limit) break;
        out.push_back({it->first, it->second});
    }
    return out;
}

std::size_t SnapshotStore::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    std::size_t n = 0;
    for (auto it = data_.lower_bound(prefix); it != data_.end() && starts_with(it->first, prefix); ++it) ++n;
    return n;
}

bool SnapshotStore::write(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    if (!batch.guards_hold([this](const std::string& k) { return lookup(k); })) {
        return false;
    }

    std::map<std::string, std::optional<std::string>> undo;
    for (const auto& op : batch.ops()) {
        undo.emplace(op.key, lookup(op.key));
        if (op.kind == WriteBatch::OpKind::Put) {
            data_[op.key] = op.value;
        } else {
            data_.erase(op.key);
        }
    }
    try {
        persist_locked();
    } catch (...) {
        for (const auto& [key, prev] : undo) {
            if (prev) data_[key] = *prev;
            else data_.erase(key);
        }
        throw;
    }
    return true;
}

void SnapshotStore::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_open();
    std::error_code ec;
    fs::remove(snapshot_path_, ec);
    if (ec) throw StoreError("cannot remove " + snapshot_path_.string() + ": " + ec.message());
    data_.clear();
}

void SnapshotStore::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!open_) return;
    open_ = false;
    lock_.release();
}
