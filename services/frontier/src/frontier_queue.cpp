#include "frontier_queue.hpp"
#include "fingerprint.hpp"
#include "queue_key.hpp"
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Pending keys fetched per scan in pop()/peek(); losers of a race move on to
// the next key in the window before rescanning.
constexpr std::size_t kScanWindow = 16;

void guard_unknown_id(WriteBatch& batch, const std::string& id) {
    batch.expect_absent(item_key(id));
    batch.expect_absent(processing_key(id));
    batch.expect_absent(completed_key(id));
    batch.expect_absent(failed_key(id));
}

void add_pending(WriteBatch& batch, const CrawlItem& item) {
    batch.put(item_key(item.item_id), serialize_item(item));
    batch.put(queue_key(item), item.item_id);
}

// nullopt for a stored body that no longer parses as an item.
std::optional<CrawlItem> decode_body(const std::string& body) {
    try {
        return deserialize_item(body);
    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

CrawlItem as_pending(const CrawlItem& item) {
    CrawlItem pending = item;
    pending.leased_at.reset();
    return pending;
}

}  // namespace

void to_json(json& j, const FrontierStats& s) {
    j = json{
        {"total_items", s.total_items},
        {"pending_items", s.pending_items},
        {"processing_items", s.processing_items},
        {"completed_items", s.completed_items},
        {"failed_items", s.failed_items},
        {"unique_fingerprints", s.unique_fingerprints},
        {"items_by_priority", s.items_by_priority},
        {"items_by_adapter", s.items_by_adapter},
    };
}

void from_json(const json& j, FrontierStats& s) {
    s.total_items = j.value("total_items", std::size_t{0});
    s.pending_items = j.value("pending_items", std::size_t{0});
    s.processing_items = j.value("processing_items", std::size_t{0});
    s.completed_items = j.value("completed_items", std::size_t{0});
    s.failed_items = j.value("failed_items", std::size_t{0});
    s.unique_fingerprints = j.value("unique_fingerprints", std::size_t{0});
    s.items_by_priority = j.value("items_by_priority", std::map<std::string, std::size_t>{});
    s.items_by_adapter = j.value("items_by_adapter", std::map<std::string, std::size_t>{});
}

FrontierQueue::FrontierQueue(std::unique_ptr<StateStore> store) : store_(std::move(store)) {
    if (!store_) throw ConfigError("frontier queue needs a state store");
}

FrontierQueue::FrontierQueue(const std::filesystem::path& dir, StoreBackend backend)
    : store_(open_state_store(dir, backend)) {
    std::cout << "[frontier] queue open at " << dir.string() << " (backend " << store_->backend_id() << ")" << std::endl;
}

FrontierQueue::~FrontierQueue() = default;

bool FrontierQueue::id_known(const std::string& item_id) const {
    return store_->get(item_key(item_id)) || store_->get(processing_key(item_id)) ||
           store_->get(completed_key(item_id)) || store_->get(failed_key(item_id));
}

bool FrontierQueue::push(const CrawlItem& item, bool check_duplicate) {
    validate_item(item);
    const std::string seen = seen_key(fingerprint(item));
    if (check_duplicate && store_->get(seen)) return false;
    if (id_known(item.item_id)) return false;

    WriteBatch batch;
    if (check_duplicate) {
        batch.expect_absent(seen);
        batch.put(seen, "1");
    }
    guard_unknown_id(batch, item.item_id);
    add_pending(batch, as_pending(item));
    // A failed guard means a concurrent push took the fingerprint or the id.
    return store_->write(batch);
}

std::size_t FrontierQueue::push_many(const std::vector<CrawlItem>& items, bool check_duplicate) {
    for (const auto& item : items) validate_item(item);

    for (;;) {
        WriteBatch batch;
        std::set<std::string> batch_seen;
        std::set<std::string> batch_ids;
        std::size_t added = 0;

        for (const auto& item : items) {
            const std::string seen = seen_key(fingerprint(item));
            if (check_duplicate) {
                if (batch_seen.count(seen) || store_->get(seen)) continue;
            }
            if (batch_ids.count(item.item_id) || id_known(item.item_id)) continue;

            if (check_duplicate) {
                batch_seen.insert(seen);
                batch.expect_absent(seen);
                batch.put(seen, "1");
            }
            batch_ids.insert(item.item_id);
            guard_unknown_id(batch, item.item_id);
            add_pending(batch, as_pending(item));
            ++added;
        }

        if (added == 0) return 0;
        if (store_->write(batch)) return added;
        // Lost a fingerprint or id to a concurrent writer; re-run the checks
        // against the state it left behind.
    }
}

std::optional<CrawlItem> FrontierQueue::pop() {
    for (;;) {
        auto candidates = store_->scan(kQueuePrefix, kScanWindow);
        if (candidates.empty()) return std::nullopt;

        for (const auto& entry : candidates) {
            const std::string& id = entry.value;
            auto body = store_->get(item_key(id));
            if (!body) {
                // Queue key without a body: left behind by an interrupted write.
                WriteBatch repair;
                repair.expect_value(entry.key, id);
                repair.expect_absent(item_key(id));
                repair.remove(entry.key);
                if (store_->write(repair)) {
                    std::cerr << "[frontier] removed orphaned queue entry " << entry.key << std::endl;
                }
                continue;
            }

            std::optional<CrawlItem> decoded = decode_body(*body);
            if (!decoded) {
                // Park the unreadable body in Failed so it stops blocking the head.
                WriteBatch quarantine;
                quarantine.expect_value(entry.key, id);
                quarantine.expect_value(item_key(id), *body);
                quarantine.remove(entry.key);
                quarantine.remove(item_key(id));
                quarantine.put(failed_key(id), *body);
                if (store_->write(quarantine)) {
                    std::cerr << "[frontier] moved undecodable pending item " << id << " to failed" << std::endl;
                }
                continue;
            }
            CrawlItem item = std::move(*decoded);
            item.leased_at = now_utc();

            WriteBatch batch;
            batch.expect_value(entry.key, id);
            batch.expect_value(item_key(id), *body);
            batch.remove(entry.key);
            batch.remove(item_key(id));
            batch.put(processing_key(id), serialize_item(item));
            if (store_->write(batch)) return item;
            // Another caller committed first for this key.
        }
    }
}

std::vector<CrawlItem> FrontierQueue::peek(std::size_t count) const {
    std::vector<CrawlItem> out;
    std::string cursor;
    while (out.size() < count) {
        auto window = store_->scan(kQueuePrefix, kScanWindow, cursor);
        if (window.empty()) break;
        for (const auto& entry : window) {
            if (out.size() >= count) break;
            auto body = store_->get(item_key(entry.value));
            if (!body) continue;
            if (auto item = decode_body(*body)) out.push_back(std::move(*item));
        }
        cursor = window.back().key;
    }
    return out;
}

bool FrontierQueue::complete(const std::string& item_id) {
    auto body = store_->get(processing_key(item_id));
    if (!body) return false;

    CrawlItem item = deserialize_item(*body);
    item.leased_at.reset();

    WriteBatch batch;
    batch.expect_value(processing_key(item_id), *body);
    batch.remove(processing_key(item_id));
    batch.put(completed_key(item_id), serialize_item(item));
    return store_->write(batch);
}

bool FrontierQueue::fail(const std::string& item_id, bool requeue) {
    auto body = store_->get(processing_key(item_id));
    if (!body) return false;
    return settle_failure(*body, requeue, nullptr);
}

bool FrontierQueue::settle_failure(const std::string& body, bool requeue, bool* requeued) {
    CrawlItem item = deserialize_item(body);
    const std::string id = item.item_id;
    item.retry_count += 1;
    item.leased_at.reset();

    const bool back_to_pending = requeue && item.retry_count < item.max_retries;

    WriteBatch batch;
    batch.expect_value(processing_key(id), body);
    batch.remove(processing_key(id));
    if (back_to_pending) {
        item.priority = demote(item.priority);
        add_pending(batch, item);
    } else {
        batch.put(failed_key(id), serialize_item(item));
    }
    if (!store_->write(batch)) return false;
    if (requeued) *requeued = back_to_pending;
    return true;
}

std::size_t FrontierQueue::recover_stalled(double timeout_seconds) {
    if (std::isnan(timeout_seconds) || timeout_seconds < 0) {
        throw std::invalid_argument("stall timeout must be a non-negative number of seconds");
    }
    const Timestamp now = now_utc();
    // Compared in floating point: huge or infinite timeouts never overflow.
    const std::chrono::duration<double> timeout(timeout_seconds);

    std::size_t requeued_count = 0;
    std::size_t failed_count = 0;
    for (const auto& entry : store_->scan(kProcessingPrefix)) {
        std::optional<CrawlItem> item = decode_body(entry.value);
        if (!item) {
            std::cerr << "[frontier] recover_stalled: skipping undecodable record " << entry.key << std::endl;
            continue;
        }
        const Timestamp since = item->leased_at.value_or(item->created_at);
        if (std::chrono::duration<double>(now - since) <= timeout) continue;

        bool requeued = false;
        if (!settle_failure(entry.value, true, &requeued)) continue;
        if (requeued) ++requeued_count;
        else ++failed_count;
    }
    if (requeued_count || failed_count) {
        std::cout << "[frontier] recover_stalled: requeued " << requeued_count
                  << ", moved to failed " << failed_count << std::endl;
    }
    return requeued_count;
}

bool FrontierQueue::is_duplicate(const CrawlItem& item) const {
    return store_->get(seen_key(fingerprint(item))).has_value();
}

FrontierStats FrontierQueue::stats() const {
    FrontierStats s;
    s.pending_items = store_->count(kQueuePrefix);
    s.processing_items = store_->count(kProcessingPrefix);
    s.completed_items = store_->count(kCompletedPrefix);
    s.failed_items = store_->count(kFailedPrefix);
    s.unique_fingerprints = store_->count(kSeenPrefix);
    s.total_items = s.pending_items + s.processing_items + s.completed_items + s.failed_items;

    for (const auto& entry : store_->scan(kQueuePrefix)) {
        auto body = store_->get(item_key(entry.value));
        if (!body) continue;
        auto item = decode_body(*body);
        if (!item) continue;
        s.items_by_priority[priority_name(item->priority)] += 1;
        s.items_by_adapter[item->adapter_id.empty() ? "unknown" : item->adapter_id] += 1;
    }
    return s;
}

std::size_t FrontierQueue::size() const {
    return store_->count(kQueuePrefix);
}

void FrontierQueue::clear() {
    store_->clear();
}

void FrontierQueue::close() {
    store_->close();
}
