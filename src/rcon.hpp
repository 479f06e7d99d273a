#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace rconbridge {

// Source RCON wire format (little-endian):
//   int32 size   -- bytes that follow: 4 (id) + 4 (type) + body + 2
//   int32 id
//   int32 type
//   body, then two NUL bytes
namespace rcon {

constexpr int32_t SERVERDATA_RESPONSE_VALUE = 0;
constexpr int32_t SERVERDATA_AUTH_RESPONSE  = 2;
constexpr int32_t SERVERDATA_EXECCOMMAND    = 2;
constexpr int32_t SERVERDATA_AUTH           = 3;

constexpr int32_t AUTH_FAILED_ID = -1;

constexpr size_t MIN_PACKET_SIZE = 10;
constexpr size_t MAX_OUTGOING_BODY = 4086;     // 4096-byte packet limit
constexpr size_t MAX_INCOMING_SIZE = 1 << 20;  // sanity bound on replies

struct Packet {
    int32_t id = 0;
    int32_t type = 0;
    std::string body;
};

std::string encode_packet(const Packet& packet);

// Decode the packet at the front of buf. Returns bytes consumed, or 0 when
// buf does not hold a complete packet yet. Throws RconError on a size field
// outside [MIN_PACKET_SIZE, MAX_INCOMING_SIZE].
size_t decode_packet(const std::string& buf, Packet& out);

} // namespace rcon

// Transport or protocol failure. sent() tells whether the command bytes
// were fully written before the failure: an unsent command is safe to retry
// on a new connection, a sent one may already have run.
class RconError : public std::runtime_error {
public:
    explicit RconError(const std::string& what, bool sent = false)
        : std::runtime_error(what), sent_(sent) {}
    bool sent() const { return sent_; }

private:
    bool sent_;
};

// The server rejected the password. Not retried automatically.
class RconAuthError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One authenticated console connection. Calls are serialized by the owner.
class RconConnection {
public:
    virtual ~RconConnection() = default;

    // Throws RconAuthError on rejection, RconError on transport failure.
    virtual void authenticate(const std::string& password) = 0;

    // Run one command and return the server's reply text. Throws
    // std::invalid_argument for a command the wire format cannot carry.
    virtual std::string execute(const std::string& command) = 0;
};

class TcpRconConnection : public RconConnection {
public:
    // Resolve and connect to "host:port"; timeout_ms bounds the connect and
    // every later read or write. Throws RconError.
    static std::unique_ptr<TcpRconConnection> connect(const std::string& address,
                                                      uint32_t timeout_ms);
    ~TcpRconConnection() override;

    TcpRconConnection(const TcpRconConnection&) = delete;
    TcpRconConnection& operator=(const TcpRconConnection&) = delete;

    void authenticate(const std::string& password) override;
    std::string execute(const std::string& command) override;

private:
    explicit TcpRconConnection(int fd) : fd_(fd) {}

    int32_t next_id();
    // Drain what the idle socket holds without blocking. Throws RconError
    // with sent() == false when the server has already closed or reset it.
    void ensure_peer_open();
    // Throws RconError with sent() == false unless every byte went out.
    void write_packet(const rcon::Packet& packet);
    rcon::Packet read_packet(bool command_sent);

    int fd_;
    int32_t last_id_ = 0;
    std::string rx_;
};

} // namespace rconbridge
