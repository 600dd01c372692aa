#include "queue_key.hpp"
#include <cstdio>

std::string encode_queue_key(CrawlPriority priority, Timestamp created_at, const std::string& item_id) {
    long long us = to_micros(created_at);
    if (us < 0) us = 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%016lld:", static_cast<int>(priority), us);
    return kQueuePrefix + buf + item_id;
}

std::string queue_key(const CrawlItem& item) {
    return encode_queue_key(item.priority, item.created_at, item.item_id);
}
