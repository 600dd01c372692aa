#pragma once
#include "crawl_item.hpp"
#include <string>

// Key namespaces inside the state store.
inline const std::string kQueuePrefix = "q:";
inline const std::string kProcessingPrefix = "proc:";
inline const std::string kCompletedPrefix = "done:";
inline const std::string kFailedPrefix = "fail:";
inline const std::string kItemPrefix = "item:";
inline const std::string kSeenPrefix = "seen:";

// "q:" + %02d priority + ":" + %016lld microseconds + ":" + item id.
// Fixed-width fields make byte order equal priority, then age, then id order.
// Times before the epoch clamp to zero.
std::string encode_queue_key(CrawlPriority priority, Timestamp created_at, const std::string& item_id);
std::string queue_key(const CrawlItem& item);

inline std::string item_key(const std::string& item_id) { return kItemPrefix + item_id; }
inline std::string processing_key(const std::string& item_id) { return kProcessingPrefix + item_id; }
inline std::string completed_key(const std::string& item_id) { return kCompletedPrefix + item_id; }
inline std::string failed_key(const std::string& item_id) { return kFailedPrefix + item_id; }
inline std::string seen_key(const std::string& fingerprint) { return kSeenPrefix + fingerprint; }
