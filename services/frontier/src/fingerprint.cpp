#include "fingerprint.hpp"

using json = nlohmann::json;

namespace {
constexpr std::size_t kFingerprintLength = 16;
}

json canonical_target(const CrawlItem& item) {
    // nlohmann::json objects are std::map backed, so dump() is key-sorted.
    const std::string* url = item.url();
    const json* query = item.query();
    return json{
        {"adapter_id", item.adapter_id},
        {"query", query ? *query : json::object()},
        {"url", url ? json(*url) : json(nullptr)},
    };
}

std::string fingerprint(const CrawlItem& item) {
    return sha256_hex(canonical_target(item).dump()).substr(0, kFingerprintLength);
}
