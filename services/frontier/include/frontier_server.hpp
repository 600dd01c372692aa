#pragma once
#include "frontier_queue.hpp"
#include <map>
#include <string>

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct HttpReply {
    unsigned status{200};
    std::string body; // JSON, empty for 204
};

// JSON-over-HTTP front end for one FrontierQueue (libmicrohttpd, internal
// polling thread).
class FrontierServer {
public:
    explicit FrontierServer(FrontierQueue& queue);
    ~FrontierServer();

    FrontierServer(const FrontierServer&) = delete;
    FrontierServer& operator=(const FrontierServer&) = delete;

    // port 0 binds an ephemeral port; port() reports the bound one.
    bool start(int port);
    void stop();
    int port() const { return port_; }

    // Routes one request. Exceptions become 400 (bad input) or 500 replies.
    HttpReply handle(const HttpRequest& req);

private:
    FrontierQueue& queue_;
    struct MHD_Daemon* daemon_ {nullptr};
    int port_{0};
};
