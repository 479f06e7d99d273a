#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace rconbridge {

// ── Identities ──────────────────────────────────────────────────

struct Identity {
    std::string platform;
    std::string user_id;

    bool operator==(const Identity& o) const {
        return platform == o.platform && user_id == o.user_id;
    }
};

struct IdentityLink {
    std::string source_platform;
    std::string source_user_id;
    std::string target_platform;
    std::string target_user_id;
};

// ── Inbound (stream -> console) ─────────────────────────────────

// Closed set of stream events the bridge knows how to map. Anything else
// arrives as Unknown and translates to nothing.
enum class EventKind { Chat, Cheer, Subscribe, GiftSubscription, Follow, Redemption, Unknown };

const char* event_kind_name(EventKind kind);

// Map an EventSub subscription type ("channel.cheer") to a kind.
EventKind event_kind_from_subscription(const std::string& subscription_type);

struct InboundEvent {
    std::string fingerprint;
    std::string source_platform;
    std::string source_user_id;
    EventKind kind = EventKind::Unknown;
    std::string subscription_type;  // raw upstream type, for logs

    std::string user_name;
    std::string message;
    std::string message_id;  // platform chat message id (echo suppression)
    std::string color;       // "RRGGBB" without '#', empty if unset
    std::string tier;
    std::string reward;
    int64_t amount = 0;      // bits, gifted subs, ...

    nlohmann::json payload;  // raw "event" object
};

struct ConsoleCommand {
    std::string text;
    std::string fingerprint;  // originating event
};

// ── Outbound (log -> stream) ────────────────────────────────────

struct LogEvent {
    std::string raw_line;
    uint64_t byte_offset = 0;  // offset of the first byte of the line
    uint64_t timestamp = 0;    // epoch seconds when read
};

enum class LogLineKind { Chat, Join, Leave, PlayerList, Notice, Unknown };

struct LogLineEvent {
    LogLineKind kind = LogLineKind::Unknown;
    std::string tag;    // "CHAT", "JOIN", ...
    std::string actor;  // player name; empty for server-wide lines
    std::string text;
    std::vector<std::pair<std::string, std::string>> players;  // PLAYERLIST: name, surface
    LogEvent source;
};

struct ChatPayload {
    std::string text;
    std::optional<std::string> sender_user_id;  // send as this user; nullopt = bot
    std::string origin;                         // raw log line, for logs
};

// ── Outcomes and states ─────────────────────────────────────────

enum class RelayOutcome {
    Relayed,
    Unauthenticated,
    DuplicateEvent,
    UnresolvedIdentity,
    TranslationNoop,
    ConsoleUnavailable,
    ConsoleAuthRejected,
    QueueFull,
    Filtered,
    Echo,
    Malformed,
    DeliveryFailed,
};

const char* outcome_name(RelayOutcome outcome);

enum class ConsoleState { Disconnected, Connecting, Authenticating, Ready, AuthRejected };

const char* console_state_name(ConsoleState state);

} // namespace rconbridge
