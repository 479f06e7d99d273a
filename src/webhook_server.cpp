#include "webhook_server.hpp"
#include "log.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace rconbridge {

static constexpr size_t MAX_HEADER_BYTES = 16384;

std::string WebhookRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

const char* http_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

bool parse_request_head(const std::string& head, WebhookRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = head.substr(0, rl_end);

    std::istringstream ss(request_line);
    std::string target, version;
    if (!(ss >> req.method >> target >> version)) return false;
    if (!starts_with(version, "HTTP/1.")) return false;
    req.path = target.substr(0, target.find('?'));
    if (req.path.empty()) return false;

    if (rl_end == std::string::npos) return true;
    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string line = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

static void send_response(int fd, const WebhookResponse& resp) {
    std::string out =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + http_reason(resp.status) + "\r\n"
        "Content-Type: " + resp.content_type + "\r\n"
        "Content-Length: " + std::to_string(resp.body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + resp.body;

    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

static void send_status(int fd, int status, const std::string& body) {
    WebhookResponse resp;
    resp.status = status;
    resp.body = body;
    send_response(fd, resp);
}

// ── WebhookServer ─────────────────────────────────────────────────────

WebhookServer::WebhookServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

WebhookServer::~WebhookServer() {
    stop();
}

void WebhookServer::close_fds() {
    if (server_fd_ >= 0)        { ::close(server_fd_);        server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0) { ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0) { ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1; }
}

bool WebhookServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_host_port(listen_addr_, host, port, true)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_fds();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_fds();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    if (::listen(server_fd_, 16) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    socklen_t len = sizeof(sa);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&sa), &len) == 0) {
        bound_port_ = ntohs(sa.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    log_info("webhook", "Listening on " + host + ":" + std::to_string(bound_port_));
    return true;
}

void WebhookServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n;  // the poll timeout covers a failed wakeup
    }
    if (thread_.joinable()) thread_.join();
    close_fds();
}

void WebhookServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        int cfd = ::accept(server_fd_, nullptr, nullptr);
        if (cfd < 0) continue;
        struct timeval tv{10, 0};
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        handle_connection(cfd);
        ::close(cfd);
    }
}

void WebhookServer::handle_connection(int fd) const {
    std::string buf;
    buf.reserve(4096);
    char tmp[1024];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > MAX_HEADER_BYTES) {
            send_status(fd, 400, "Headers too large");
            return;
        }
    }

    auto head_end = buf.find("\r\n\r\n");
    WebhookRequest req;
    if (!parse_request_head(buf.substr(0, head_end), req)) {
        send_status(fd, 400, "Malformed request");
        return;
    }

    if (req.method == "POST") {
        std::string cl = req.header("content-length");
        if (cl.empty()) {
            send_status(fd, 411, "Content-Length required");
            return;
        }
        unsigned long long content_len = 0;
        for (char c : cl) {
            if (c < '0' || c > '9') {
                send_status(fd, 400, "Bad Content-Length");
                return;
            }
            content_len = content_len * 10 + static_cast<unsigned long long>(c - '0');
            if (content_len > max_body_) break;
        }
        if (content_len > max_body_) {
            send_status(fd, 413, "Payload too large");
            return;
        }

        req.body = buf.substr(head_end + 4);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) {
                send_status(fd, 400, "Truncated body");
                return;
            }
            req.body.append(tmp, static_cast<size_t>(n));
        }
        req.body.resize(static_cast<size_t>(content_len));
    }

    WebhookResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        log_error("webhook", std::string("Handler failed: ") + e.what());
        resp.status = 500;
        resp.body = "Internal error";
    }
    send_response(fd, resp);
}

} // namespace rconbridge
