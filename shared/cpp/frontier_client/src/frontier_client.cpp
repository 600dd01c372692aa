#include "frontier_client.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};

const char* flag(bool v) { return v ? "1" : "0"; }
}

std::string format_seconds(double seconds) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << seconds;
    return out.str();
}

FrontierClient::FrontierClient(std::string base_url) : base_(std::move(base_url)) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

FrontierClient::Reply FrontierClient::request(const char* method, const std::string& path, const std::string* body) {
    CurlHandle c;
    std::string url = base_ + path;
    Reply r;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method);
    if (std::string(method) == "POST") {
        c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
        const std::string& payload = body ? *body : std::string();
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)payload.size());
        curl_easy_setopt(c.h, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &r.body);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string("frontier ") + method + " " + path + ": " + curl_easy_strerror(code));
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &r.status);
    if (r.status < 200 || r.status >= 300) {
        std::ostringstream msg;
        msg << "frontier " << method << " " << path << " returned " << r.status << ": " << r.body;
        throw std::runtime_error(msg.str());
    }
    return r;
}

bool FrontierClient::push(const CrawlItem& item, bool check_duplicate) {
    std::string body = json(item).dump();
    auto r = request("POST", std::string("/push?check_duplicate=") + flag(check_duplicate), &body);
    return json::parse(r.body).at("added").get<bool>();
}

std::size_t FrontierClient::push_many(const std::vector<CrawlItem>& items, bool check_duplicate) {
    json arr = json::array();
    for (const auto& item : items) arr.push_back(json(item));
    std::string body = json({{"items", arr}}).dump();
    auto r = request("POST", std::string("/push_many?check_duplicate=") + flag(check_duplicate), &body);
    return json::parse(r.body).at("added").get<std::size_t>();
}

std::optional<CrawlItem> FrontierClient::pop() {
    auto r = request("GET", "/pop");
    if (r.status == 204) return std::nullopt;
    return json::parse(r.body).get<CrawlItem>();
}

std::vector<CrawlItem> FrontierClient::peek(std::size_t count) {
    auto r = request("GET", "/peek?count=" + std::to_string(count));
    std::vector<CrawlItem> out;
    for (const auto& j : json::parse(r.body).at("items")) out.push_back(j.get<CrawlItem>());
    return out;
}

bool FrontierClient::complete(const std::string& item_id) {
    auto r = request("POST", "/complete/" + item_id);
    return json::parse(r.body).at("ok").get<bool>();
}

bool FrontierClient::fail(const std::string& item_id, bool requeue) {
    auto r = request("POST", "/fail/" + item_id + "?requeue=" + flag(requeue));
    return json::parse(r.body).at("ok").get<bool>();
}

std::size_t FrontierClient::recover_stalled(double timeout_seconds) {
    auto r = request("POST", "/recover?timeout=" + format_seconds(timeout_seconds));
    return json::parse(r.body).at("recovered").get<std::size_t>();
}

bool FrontierClient::is_duplicate(const CrawlItem& item) {
    std::string body = json(item).dump();
    auto r = request("POST", "/duplicate", &body);
    return json::parse(r.body).at("duplicate").get<bool>();
}

FrontierStats FrontierClient::stats() {
    auto r = request("GET", "/stats");
    return json::parse(r.body).get<FrontierStats>();
}

std::size_t FrontierClient::size() {
    auto r = request("GET", "/len");
    return json::parse(r.body).at("pending").get<std::size_t>();
}
