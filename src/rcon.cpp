#include "rcon.hpp"
#include "log.hpp"
#include "util.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace rconbridge {
namespace rcon {

static void put_le32(std::string& out, int32_t v) {
    uint32_t u = static_cast<uint32_t>(v);
    out += static_cast<char>(u & 0xff);
    out += static_cast<char>((u >> 8) & 0xff);
    out += static_cast<char>((u >> 16) & 0xff);
    out += static_cast<char>((u >> 24) & 0xff);
}

static int32_t get_le32(const std::string& buf, size_t at) {
    uint32_t u = static_cast<uint32_t>(static_cast<unsigned char>(buf[at]))
               | static_cast<uint32_t>(static_cast<unsigned char>(buf[at + 1])) << 8
               | static_cast<uint32_t>(static_cast<unsigned char>(buf[at + 2])) << 16
               | static_cast<uint32_t>(static_cast<unsigned char>(buf[at + 3])) << 24;
    return static_cast<int32_t>(u);
}

std::string encode_packet(const Packet& packet) {
    std::string out;
    out.reserve(packet.body.size() + 14);
    put_le32(out, static_cast<int32_t>(packet.body.size() + MIN_PACKET_SIZE));
    put_le32(out, packet.id);
    put_le32(out, packet.type);
    out += packet.body;
    out += '\0';
    out += '\0';
    return out;
}

size_t decode_packet(const std::string& buf, Packet& out) {
    if (buf.size() < 4) return 0;
    int32_t size = get_le32(buf, 0);
    if (size < static_cast<int32_t>(MIN_PACKET_SIZE) ||
        static_cast<size_t>(size) > MAX_INCOMING_SIZE) {
        throw RconError("invalid packet size " + std::to_string(size), true);
    }
    size_t total = 4 + static_cast<size_t>(size);
    if (buf.size() < total) return 0;

    out.id = get_le32(buf, 4);
    out.type = get_le32(buf, 8);
    out.body = buf.substr(12, static_cast<size_t>(size) - MIN_PACKET_SIZE);
    // Some servers send a single terminator; trailing NULs are not text.
    while (!out.body.empty() && out.body.back() == '\0') out.body.pop_back();
    return total;
}

} // namespace rcon

// ── TcpRconConnection ─────────────────────────────────────────

static void set_io_timeouts(int fd, uint32_t timeout_ms) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#ifdef SO_NOSIGPIPE  // macOS
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif
}

// Non-blocking connect bounded by timeout_ms. Returns 0 or an errno value.
static int connect_with_timeout(int fd, const sockaddr* addr, socklen_t len,
                                uint32_t timeout_ms) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr, len);
    int err = 0;
    if (rc != 0) {
        if (errno != EINPROGRESS) {
            err = errno;
        } else {
            struct pollfd pfd{fd, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
            if (ready == 0) {
                err = ETIMEDOUT;
            } else if (ready < 0) {
                err = errno;
            } else {
                socklen_t elen = sizeof(err);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
            }
        }
    }

    ::fcntl(fd, F_SETFL, flags);
    return err;
}

std::unique_ptr<TcpRconConnection> TcpRconConnection::connect(const std::string& address,
                                                              uint32_t timeout_ms) {
    std::string host;
    uint16_t port = 0;
    if (!parse_host_port(address, host, port)) {
        throw RconError("invalid console address: " + address);
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0 || !res) {
        throw RconError("cannot resolve " + host + ": " + gai_strerror(gai));
    }

    std::string last_error = "no addresses";
    int fd = -1;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        int err = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms);
        if (err == 0) break;
        last_error = std::strerror(err);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        throw RconError("connect to " + address + " failed: " + last_error);
    }
    set_io_timeouts(fd, timeout_ms);
    return std::unique_ptr<TcpRconConnection>(new TcpRconConnection(fd));
}

TcpRconConnection::~TcpRconConnection() {
    if (fd_ >= 0) ::close(fd_);
}

int32_t TcpRconConnection::next_id() {
    // Positive ids only; -1 is the auth failure marker.
    if (last_id_ == INT32_MAX) last_id_ = 0;
    return ++last_id_;
}

void TcpRconConnection::write_packet(const rcon::Packet& packet) {
    std::string wire = rcon::encode_packet(packet);
    size_t written = 0;
    while (written < wire.size()) {
        ssize_t n = ::send(fd_, wire.data() + written, wire.size() - written, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw RconError(std::string("send failed: ") +
                            (n < 0 ? std::strerror(errno) : "connection closed"));
        }
        written += static_cast<size_t>(n);
    }
}

rcon::Packet TcpRconConnection::read_packet(bool command_sent) {
    char tmp[4096];
    for (;;) {
        rcon::Packet packet;
        size_t used = rcon::decode_packet(rx_, packet);
        if (used > 0) {
            rx_.erase(0, used);
            return packet;
        }
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) throw RconError("connection closed by server", command_sent);
        if (n < 0) {
            bool timeout = errno == EAGAIN || errno == EWOULDBLOCK;
            throw RconError(timeout ? "timed out waiting for response"
                                    : std::string("recv failed: ") + std::strerror(errno),
                            command_sent);
        }
        rx_.append(tmp, static_cast<size_t>(n));
    }
}

void TcpRconConnection::ensure_peer_open() {
    // A server restart while idle leaves a FIN (or RST) waiting on the socket.
    // Writing into it would still succeed, and the command would be lost.
    char tmp[4096];
    for (;;) {
        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
#ifdef POLLRDHUP
        pfd.events |= POLLRDHUP;
#endif
        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return;

        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), MSG_DONTWAIT);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) throw RconError("connection closed by server while idle", false);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw RconError(std::string("connection failed while idle: ") + std::strerror(errno),
                            false);
        }
        // Late replies to timed-out commands; read_packet skips them by id
        rx_.append(tmp, static_cast<size_t>(n));
    }
}

void TcpRconConnection::authenticate(const std::string& password) {
    rcon::Packet auth;
    auth.id = next_id();
    auth.type = rcon::SERVERDATA_AUTH;
    auth.body = password;
    write_packet(auth);

    // Source servers may send an empty RESPONSE_VALUE before the auth reply.
    for (;;) {
        rcon::Packet reply = read_packet(true);
        if (reply.type != rcon::SERVERDATA_AUTH_RESPONSE) continue;
        if (reply.id == rcon::AUTH_FAILED_ID) {
            throw RconAuthError("console rejected the password");
        }
        if (reply.id == auth.id) return;
        log_debug("rcon", "Ignoring auth reply for id " + std::to_string(reply.id));
    }
}

std::string TcpRconConnection::execute(const std::string& command) {
    if (command.size() > rcon::MAX_OUTGOING_BODY) {
        throw std::invalid_argument("command exceeds " +
                                    std::to_string(rcon::MAX_OUTGOING_BODY) + " bytes");
    }
    ensure_peer_open();

    rcon::Packet exec;
    exec.id = next_id();
    exec.type = rcon::SERVERDATA_EXECCOMMAND;
    exec.body = command;
    write_packet(exec);

    for (;;) {
        rcon::Packet reply = read_packet(true);
        if (reply.id == rcon::AUTH_FAILED_ID) {
            throw RconError("console dropped authentication", true);
        }
        if (reply.id == exec.id && reply.type == rcon::SERVERDATA_RESPONSE_VALUE) {
            return reply.body;
        }
        // Stale reply to an earlier, timed-out command
    }
}

} // namespace rconbridge
