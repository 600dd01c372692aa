#pragma once
#include "crawl_item.hpp"
#include <string>

// Canonical {"adapter_id","query","url"} object; keys sort at every level.
nlohmann::json canonical_target(const CrawlItem& item);

// First 16 hex chars of SHA-256 over the canonical target. Priority, context
// and timestamps do not contribute.
std::string fingerprint(const CrawlItem& item);
