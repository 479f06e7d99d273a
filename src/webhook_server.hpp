#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <cstdint>

namespace rconbridge {

// A parsed inbound HTTP request. Header names are lowercased.
struct WebhookRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;

    // Header value, or "" if absent. name must be lowercase.
    std::string header(const std::string& name) const;
};

struct WebhookResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Parse the request line and headers of an HTTP/1.x request head (everything
// before the blank line). Query strings are stripped from the path.
bool parse_request_head(const std::string& head, WebhookRequest& req);

const char* http_reason(int status);

// Small HTTP/1.1 listener for platform webhook deliveries. Meant to sit
// behind a TLS-terminating reverse proxy. One connection at a time on a
// background accept thread; every response closes the connection.
class WebhookServer {
public:
    using Handler = std::function<WebhookResponse(const WebhookRequest&)>;

    // listen_addr: "host:port"; port 0 binds any free port (see bound_port).
    // max_body: larger POST bodies are answered with 413 before the handler.
    WebhookServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~WebhookServer();

    WebhookServer(const WebhookServer&) = delete;
    WebhookServer& operator=(const WebhookServer&) = delete;

    // Bind, listen and start the accept thread. On failure fills error.
    bool start(std::string& error);
    void stop();

    uint16_t bound_port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;
    void close_fds();

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace rconbridge
