#include "state_store.hpp"
#include "snapshot_store.hpp"
#include "sqlite_store.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

void WriteBatch::put(std::string key, std::string value) {
    ops_.push_back({OpKind::Put, std::move(key), std::move(value)});
}

void WriteBatch::remove(std::string key) {
    ops_.push_back({OpKind::Delete, std::move(key), {}});
}

void WriteBatch::expect_present(std::string key) {
    guards_.push_back({GuardKind::Present, std::move(key), {}});
}

void WriteBatch::expect_absent(std::string key) {
    guards_.push_back({GuardKind::Absent, std::move(key), {}});
}

void WriteBatch::expect_value(std::string key, std::string value) {
    guards_.push_back({GuardKind::Equals, std::move(key), std::move(value)});
}

DirectoryLock::DirectoryLock(const fs::path& dir) {
    const std::string path = (dir / "LOCK").string();
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw ConfigError("cannot open lock file " + path + ": " + std::strerror(errno));
    }
    // flock() conflicts between open file descriptions, so a second open from
    // the same process is refused as well.
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw ConfigError(dir.string() + " is already owned by another open frontier queue");
        }
        throw ConfigError("cannot lock " + path + ": " + std::strerror(err));
    }
}

DirectoryLock::~DirectoryLock() {
    release();
}

void DirectoryLock::release() {
    if (fd_ < 0) return;
    if (::close(fd_) != 0) {
        std::cerr << "[frontier] closing lock file failed: " << std::strerror(errno) << std::endl;
    }
    fd_ = -1;
}

StoreBackend parse_backend(const std::string& name) {
    if (name == "auto") return StoreBackend::Auto;
    if (name == "sqlite") return StoreBackend::Sqlite;
    if (name == "snapshot") return StoreBackend::Snapshot;
    throw ConfigError("unknown backend '" + name + "' (expected auto, sqlite or snapshot)");
}

const char* backend_name(StoreBackend backend) {
    switch (backend) {
    case StoreBackend::Auto: return "auto";
    case StoreBackend::Sqlite: return "sqlite";
    case StoreBackend::Snapshot: return "snapshot";
    }
    return "unknown";
}

std::unique_ptr<StateStore> open_state_store(const fs::path& dir, StoreBackend backend) {
    if (dir.empty()) throw ConfigError("frontier directory must not be empty");
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw ConfigError("cannot create " + dir.string() + ": " + ec.message());
    if (!fs::is_directory(dir)) throw ConfigError(dir.string() + " is not a directory");

    switch (backend) {
    case StoreBackend::Sqlite:
        try {
            return std::make_unique<SqliteStore>(dir);
        } catch (const StoreError& e) {
            throw ConfigError(std::string("sqlite backend unavailable: ") + e.what());
        }
    case StoreBackend::Snapshot:
        try {
            return std::make_unique<SnapshotStore>(dir);
        } catch (const StoreError& e) {
            throw ConfigError(std::string("snapshot backend unavailable: ") + e.what());
        }
    case StoreBackend::Auto:
        try {
            return std::make_unique<SqliteStore>(dir);
        } catch (const StoreError& e) {
            std::cerr << "[frontier] sqlite backend unavailable (" << e.what()
                      << "), falling back to snapshot store" << std::endl;
        }
        try {
            return std::make_unique<SnapshotStore>(dir);
        } catch (const StoreError& e) {
            throw ConfigError(std::string("no usable backend: ") + e.what());
        }
    }
    throw ConfigError("unknown backend");
}

std::string prefix_upper_bound(const std::string& prefix) {
    std::string bound = prefix;
    while (!bound.empty()) {
        unsigned char last = static_cast<unsigned char>(bound.back());
        if (last != 0xFF) {
            bound.back() = static_cast<char>(last + 1);
            return bound;
        }
        bound.pop_back();
    }
    return bound;
}
