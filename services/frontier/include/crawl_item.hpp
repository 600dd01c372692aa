#pragma once
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

// Lower value is processed first. The serialized form is the enum position.
enum class CrawlPriority : int {
    Critical = 0,
    High = 1,
    Normal = 2,
    Low = 3,
    Background = 4,
};

const char* priority_name(CrawlPriority p);
CrawlPriority priority_from_int(int value);
// One step toward Background; Background stays Background.
CrawlPriority demote(CrawlPriority p);

struct UrlTarget {
    std::string url;
};

struct QueryTarget {
    nlohmann::json query = nlohmann::json::object();
};

using CrawlTarget = std::variant<UrlTarget, QueryTarget>;

struct CrawlItem {
    std::string item_id;
    CrawlTarget target;
    std::string adapter_id;
    CrawlPriority priority{CrawlPriority::Normal};

    // informational context
    std::optional<std::string> subject_id;
    std::optional<std::string> hypothesis;
    std::optional<std::string> parent_item_id;

    Timestamp created_at{};
    std::optional<Timestamp> scheduled_at;
    int retry_count{0};
    int max_retries{3};

    // Set while the item is in Processing.
    std::optional<Timestamp> leased_at;

    static CrawlItem for_url(std::string url, std::string adapter_id,
                             CrawlPriority priority = CrawlPriority::Normal);
    static CrawlItem for_query(nlohmann::json query, std::string adapter_id,
                               CrawlPriority priority = CrawlPriority::Normal);

    const std::string* url() const;
    const nlohmann::json* query() const;
};

// Throws std::invalid_argument when the id is not a UUID, the URL is empty,
// the query is not a non-empty object, or the retry counters are negative.
void validate_item(const CrawlItem& item);

void to_json(nlohmann::json& j, const CrawlItem& item);
void from_json(const nlohmann::json& j, CrawlItem& item);

std::string serialize_item(const CrawlItem& item);
CrawlItem deserialize_item(const std::string& body);
