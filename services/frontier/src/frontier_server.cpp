#include "frontier_server.hpp"
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

constexpr double kMaxPeek = 1000;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult send_response(struct MHD_Connection* conn, unsigned status, const std::string& body, const char* ctype) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

MhdResult on_request(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                     const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }
    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    auto* server = static_cast<FrontierServer*>(cls);
    HttpReply r = server->handle(HttpRequest{ci->method, ci->url, parse_query(connection), ci->body});
    return send_response(connection, r.status, r.body, r.body.empty() ? "text/plain" : "application/json");
}

void on_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                  enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

HttpReply reply(unsigned status, const json& body) {
    return HttpReply{status, body.dump()};
}

bool query_flag(const HttpRequest& req, const char* name, bool def) {
    auto it = req.query.find(name);
    if (it == req.query.end() || it->second.empty()) return def;
    const std::string& v = it->second;
    if (v == "1" || v == "true") return true;
    if (v == "0" || v == "false") return false;
    throw std::invalid_argument(std::string(name) + " must be 0/1/true/false");
}

double query_number(const HttpRequest& req, const char* name, double def) {
    auto it = req.query.find(name);
    if (it == req.query.end() || it->second.empty()) return def;
    try {
        std::size_t used = 0;
        double v = std::stod(it->second, &used);
        if (used == it->second.size() && std::isfinite(v) && v >= 0) return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a finite non-negative number");
    }
    throw std::invalid_argument(std::string(name) + " must be a finite non-negative number");
}

// Producers may leave item_id and created_at to the service.
CrawlItem item_from_request(json j) {
    if (!j.is_object()) throw std::invalid_argument("item must be a JSON object");
    if (!j.contains("item_id") || j["item_id"].is_null()) j["item_id"] = new_uuid();
    return j.get<CrawlItem>();
}

std::string id_from_path(const std::string& path, const std::string& prefix) {
    std::string id = path.substr(prefix.size());
    if (id.empty()) throw std::invalid_argument("id required");
    return id;
}

}  // namespace

FrontierServer::FrontierServer(FrontierQueue& queue) : queue_(queue) {}

FrontierServer::~FrontierServer() {
    stop();
}

bool FrontierServer::start(int port) {
    if (daemon_) return true;
    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, static_cast<uint16_t>(port),
                               nullptr, nullptr, &on_request, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &on_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) return false;
    port_ = port;
    if (const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT)) {
        port_ = info->port;
    }
    return true;
}

void FrontierServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
}

HttpReply FrontierServer::handle(const HttpRequest& req) {
    const std::string& method = req.method;
    const std::string& path = req.path;
    try {
        if (method == "POST" && path == "/push") {
            CrawlItem item = item_from_request(json::parse(req.body));
            bool added = queue_.push(item, query_flag(req, "check_duplicate", true));
            return reply(200, {{"added", added}, {"item_id", item.item_id}});
        }
        if (method == "POST" && path == "/push_many") {
            auto j = json::parse(req.body);
            std::vector<CrawlItem> items;
            for (const auto& raw : j.at("items")) items.push_back(item_from_request(raw));
            std::size_t added = queue_.push_many(items, query_flag(req, "check_duplicate", true));
            return reply(200, {{"added", added}});
        }
        if (method == "GET" && path == "/pop") {
            auto item = queue_.pop();
            if (!item) return HttpReply{MHD_HTTP_NO_CONTENT, ""};
            return reply(200, json(*item));
        }
        if (method == "GET" && path == "/peek") {
            auto count = static_cast<std::size_t>(std::min(query_number(req, "count", 1), kMaxPeek));
            json items = json::array();
            for (const auto& item : queue_.peek(count)) items.push_back(json(item));
            return reply(200, {{"items", items}});
        }
        if (method == "POST" && path.rfind("/complete/", 0) == 0) {
            bool ok = queue_.complete(id_from_path(path, "/complete/"));
            return reply(200, {{"ok", ok}});
        }
        if (method == "POST" && path.rfind("/fail/", 0) == 0) {
            bool ok = queue_.fail(id_from_path(path, "/fail/"), query_flag(req, "requeue", true));
            return reply(200, {{"ok", ok}});
        }
        if (method == "POST" && path == "/recover") {
            std::size_t n = queue_.recover_stalled(query_number(req, "timeout", 300.0));
            return reply(200, {{"recovered", n}});
        }
        if (method == "POST" && path == "/duplicate") {
            CrawlItem item = item_from_request(json::parse(req.body));
            return reply(200, {{"duplicate", queue_.is_duplicate(item)}});
        }
        if (method == "GET" && path == "/stats") {
            return reply(200, json(queue_.stats()));
        }
        if (method == "GET" && path == "/len") {
            return reply(200, {{"pending", queue_.size()}});
        }
        if (method == "POST" && path == "/control/clear") {
            queue_.clear();
            std::cout << "[frontier] queue cleared via /control/clear" << std::endl;
            return reply(200, {{"ok", true}});
        }
        return reply(MHD_HTTP_NOT_FOUND, {{"error", "not found"}});
    } catch (const json::exception& e) {
        return reply(MHD_HTTP_BAD_REQUEST, {{"error", e.what()}});
    } catch (const std::invalid_argument& e) {
        return reply(MHD_HTTP_BAD_REQUEST, {{"error", e.what()}});
    } catch (const std::exception& e) {
        std::cerr << "[frontier] " << method << " " << path << " failed: " << e.what() << std::endl;
        return reply(MHD_HTTP_INTERNAL_SERVER_ERROR, {{"error", e.what()}});
    }
}
