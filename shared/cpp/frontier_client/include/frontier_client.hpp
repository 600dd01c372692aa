#pragma once
#include "crawl_item.hpp"
#include "frontier_queue.hpp"
#include <optional>
#include <string>
#include <vector>

// Renders seconds for a query string without losing precision.
std::string format_seconds(double seconds);

// Blocking client for frontierd. Every call throws std::runtime_error on a
// transport failure or a non-2xx reply.
class FrontierClient {
public:
    explicit FrontierClient(std::string base_url);

    bool push(const CrawlItem& item, bool check_duplicate = true);
    std::size_t push_many(const std::vector<CrawlItem>& items, bool check_duplicate = true);
    // nullopt when the queue has nothing pending (204).
    std::optional<CrawlItem> pop();
    std::vector<CrawlItem> peek(std::size_t count = 1);
    bool complete(const std::string& item_id);
    bool fail(const std::string& item_id, bool requeue = true);
    std::size_t recover_stalled(double timeout_seconds = 300.0);
    bool is_duplicate(const CrawlItem& item);
    FrontierStats stats();
    std::size_t size();

private:
    struct Reply {
        long status{0};
        std::string body;
    };
    Reply request(const char* method, const std::string& path, const std::string* body = nullptr);

    std::string base_;
};
