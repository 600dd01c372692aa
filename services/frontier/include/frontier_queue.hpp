#pragma once
#include "crawl_item.hpp"
#include "state_store.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FrontierStats {
    std::size_t total_items{0};
    std::size_t pending_items{0};
    std::size_t processing_items{0};
    std::size_t completed_items{0};
    std::size_t failed_items{0};
    std::size_t unique_fingerprints{0};
    // Pending items only.
    std::map<std::string, std::size_t> items_by_priority;
    std::map<std::string, std::size_t> items_by_adapter;
};

void to_json(nlohmann::json& j, const FrontierStats& s);
void from_json(const nlohmann::json& j, FrontierStats& s);

// Persistent priority queue of crawl items.
//
// Items move absent -> Pending -> Processing -> {Completed, Failed}, with
// fail()/recover_stalled() sending Processing items back to Pending at a
// demoted priority while retries remain. Every transition is one guarded
// StateStore batch, so concurrent callers never both win the same item.
class FrontierQueue {
public:
    explicit FrontierQueue(std::unique_ptr<StateStore> store);
    explicit FrontierQueue(const std::filesystem::path& dir, StoreBackend backend = StoreBackend::Auto);
    ~FrontierQueue();

    FrontierQueue(const FrontierQueue&) = delete;
    FrontierQueue& operator=(const FrontierQueue&) = delete;

    // False when the target+adapter fingerprint was seen before, or the item id
    // is already known. Throws std::invalid_argument for malformed items.
    bool push(const CrawlItem& item, bool check_duplicate = true);
    // Number of items actually inserted.
    std::size_t push_many(const std::vector<CrawlItem>& items, bool check_duplicate = true);

    std::optional<CrawlItem> pop();
    std::vector<CrawlItem> peek(std::size_t count = 1) const;

    bool complete(const std::string& item_id);
    bool fail(const std::string& item_id, bool requeue = true);

    // Processing items leased longer than timeout_seconds go through
    // fail(requeue=true). Returns how many went back to Pending. Throws
    // std::invalid_argument for a negative or NaN timeout.
    std::size_t recover_stalled(double timeout_seconds = 300.0);

    bool is_duplicate(const CrawlItem& item) const;
    FrontierStats stats() const;

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    void clear();
    void close();

    std::string backend_id() const { return store_->backend_id(); }

private:
    bool id_known(const std::string& item_id) const;
    // Applies the failure transition to a Processing record read as `body`.
    // Returns false when another caller changed the record first.
    bool settle_failure(const std::string& body, bool requeue, bool* requeued);

    std::unique_ptr<StateStore> store_;
};
