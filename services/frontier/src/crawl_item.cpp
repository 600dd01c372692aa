#include "crawl_item.hpp"
#include <stdexcept>

using json = nlohmann::json;

const char* priority_name(CrawlPriority p) {
    switch (p) {
    case CrawlPriority::Critical: return "CRITICAL";
    case CrawlPriority::High: return "HIGH";
    case CrawlPriority::Normal: return "NORMAL";
    case CrawlPriority::Low: return "LOW";
    case CrawlPriority::Background: return "BACKGROUND";
    }
    return "UNKNOWN";
}

CrawlPriority priority_from_int(int value) {
    if (value < static_cast<int>(CrawlPriority::Critical) || value > static_cast<int>(CrawlPriority::Background)) {
        throw std::invalid_argument("priority out of range: " + std::to_string(value));
    }
    return static_cast<CrawlPriority>(value);
}

CrawlPriority demote(CrawlPriority p) {
    if (p == CrawlPriority::Background) return p;
    return static_cast<CrawlPriority>(static_cast<int>(p) + 1);
}

CrawlItem CrawlItem::for_url(std::string url, std::string adapter_id, CrawlPriority priority) {
    CrawlItem item;
    item.item_id = new_uuid();
    item.target = UrlTarget{std::move(url)};
    item.adapter_id = std::move(adapter_id);
    item.priority = priority;
    item.created_at = now_utc();
    return item;
}

CrawlItem CrawlItem::for_query(json query, std::string adapter_id, CrawlPriority priority) {
    CrawlItem item;
    item.item_id = new_uuid();
    item.target = QueryTarget{std::move(query)};
    item.adapter_id = std::move(adapter_id);
    item.priority = priority;
    item.created_at = now_utc();
    return item;
}

const std::string* CrawlItem::url() const {
    if (auto* u = std::get_if<UrlTarget>(&target)) return &u->url;
    return nullptr;
}

const json* CrawlItem::query() const {
    if (auto* q = std::get_if<QueryTarget>(&target)) return &q->query;
    return nullptr;
}

void validate_item(const CrawlItem& item) {
    if (!is_uuid(item.item_id)) {
        throw std::invalid_argument("item_id is not a UUID: '" + item.item_id + "'");
    }
    if (auto* u = item.url()) {
        if (u->empty()) throw std::invalid_argument("url target must not be empty");
    } else if (auto* q = item.query()) {
        if (!q->is_object() || q->empty()) {
            throw std::invalid_argument("query target must be a non-empty object");
        }
    }
    for (const auto* ref : {&item.subject_id, &item.parent_item_id}) {
        if (*ref && !is_uuid(**ref)) throw std::invalid_argument("context id is not a UUID: '" + **ref + "'");
    }
    if (item.retry_count < 0 || item.max_retries < 0) {
        throw std::invalid_argument("retry counters must be non-negative");
    }
}

static json opt_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

static json opt_json(const std::optional<Timestamp>& v) {
    return v ? json(format_iso8601(*v)) : json(nullptr);
}

static std::optional<std::string> opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

static std::optional<Timestamp> opt_time(const json& j, const char* key) {
    auto s = opt_string(j, key);
    if (!s || s->empty()) return std::nullopt;
    return parse_iso8601(*s);
}

void to_json(json& j, const CrawlItem& item) {
    const std::string* url = item.url();
    const json* query = item.query();
    j = json{
        {"item_id", item.item_id},
        {"url", url ? json(*url) : json(nullptr)},
        {"query", query ? *query : json::object()},
        {"adapter_id", item.adapter_id},
        {"priority", static_cast<int>(item.priority)},
        {"subject_id", opt_json(item.subject_id)},
        {"hypothesis", opt_json(item.hypothesis)},
        {"parent_item_id", opt_json(item.parent_item_id)},
        {"created_at", format_iso8601(item.created_at)},
        {"scheduled_at", opt_json(item.scheduled_at)},
        {"retry_count", item.retry_count},
        {"max_retries", item.max_retries},
        {"leased_at", opt_json(item.leased_at)},
    };
}

void from_json(const json& j, CrawlItem& item) {
    item.item_id = j.at("item_id").get<std::string>();

    auto url = opt_string(j, "url");
    json query = json::object();
    if (auto it = j.find("query"); it != j.end() && !it->is_null()) query = *it;
    if (url) {
        if (!query.empty()) throw std::invalid_argument("item " + item.item_id + " has both url and query");
        item.target = UrlTarget{*url};
    } else {
        item.target = QueryTarget{std::move(query)};
    }

    item.adapter_id = opt_string(j, "adapter_id").value_or("");
    auto priority = j.find("priority");
    item.priority = (priority == j.end() || priority->is_null())
        ? CrawlPriority::Normal
        : priority_from_int(priority->get<int>());

    item.subject_id = opt_string(j, "subject_id");
    item.hypothesis = opt_string(j, "hypothesis");
    item.parent_item_id = opt_string(j, "parent_item_id");

    auto created = opt_time(j, "created_at");
    item.created_at = created ? *created : now_utc();
    item.scheduled_at = opt_time(j, "scheduled_at");
    item.retry_count = j.value("retry_count", 0);
    item.max_retries = j.value("max_retries", 3);
    item.leased_at = opt_time(j, "leased_at");
}

std::string serialize_item(const CrawlItem& item) {
    return json(item).dump();
}

CrawlItem deserialize_item(const std::string& body) {
    return json::parse(body).get<CrawlItem>();
}
