#pragma once
#include "model.hpp"
#include <string>
#include <cstdint>

namespace rconbridge {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ConsoleStateChanged = "ConsoleStateChanged";
    constexpr const char* CommandSubmitted    = "CommandSubmitted";
    constexpr const char* EventDropped        = "EventDropped";
    constexpr const char* ChatDelivered       = "ChatDelivered";
    constexpr const char* LogRotated          = "LogRotated";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct ConsoleStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ConsoleStateChanged;
    ConsoleState previous = ConsoleState::Disconnected;
    ConsoleState current = ConsoleState::Disconnected;
    std::string detail;

    ConsoleStateChangedEvent() { type_tag = TAG; }
};

struct CommandSubmittedEvent : Event {
    static constexpr const char* TAG = event_tags::CommandSubmitted;
    std::string command;
    std::string fingerprint;
    std::string response;

    CommandSubmittedEvent() { type_tag = TAG; }
};

struct EventDroppedEvent : Event {
    static constexpr const char* TAG = event_tags::EventDropped;
    std::string pipeline;  // "inbound" | "outbound" | "console"
    std::string fingerprint;
    RelayOutcome outcome = RelayOutcome::Malformed;
    std::string detail;

    EventDroppedEvent() { type_tag = TAG; }
};

struct ChatDeliveredEvent : Event {
    static constexpr const char* TAG = event_tags::ChatDelivered;
    std::string text;
    std::string sender_user_id;

    ChatDeliveredEvent() { type_tag = TAG; }
};

struct LogRotatedEvent : Event {
    static constexpr const char* TAG = event_tags::LogRotated;
    std::string path;
    std::string reason;  // "replaced" | "truncated"
    uint64_t rotations = 0;

    LogRotatedEvent() { type_tag = TAG; }
};

} // namespace rconbridge
