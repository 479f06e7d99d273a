#pragma once
#include "model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rconbridge {

// Parse one bridge log line. Accepted shapes, with an optional leading
// "YYYY-MM-DD HH:MM:SS " stamp:
//   [CHAT] Steve: hello          CHAT Steve: hello
//   [JOIN] Steve joined the game
//   [LEAVE] Steve left the game
//   PLAYERLIST Steve nauvis;Alex Nauvis Orbit
//   <TAG> anything else          -> Notice
// Returns nullopt for blank lines and malformed CHAT lines.
std::optional<LogLineEvent> parse_log_line(const LogEvent& event);

// Game log event -> chat payloads for the stream side.
class OutboundTranslator {
public:
    // break_names puts an invisible character into game player names so the
    // stream chat does not treat them as mentions of its own users.
    explicit OutboundTranslator(std::string platform_label, bool break_names = false);

    // Player chat is relayed as the linked stream user, so it needs a link.
    // Joins, leaves, player lists and notices go out as the bot.
    bool requires_identity(const LogLineEvent& line) const;

    std::vector<ChatPayload> translate(const LogLineEvent& line,
                                       const std::optional<Identity>& sender) const;

    // "Steve is on Nauvis, Alex is on Nauvis Orbit"
    static std::string format_player_list(
        const std::vector<std::pair<std::string, std::string>>& players,
        bool break_names = false);

    // Inserts U+E0000 after the first code point of names longer than one.
    static std::string break_name(const std::string& name);

    static constexpr const char* SERVER_ACTOR = "<server>";
    static constexpr const char* NAME_BREAK = "\xF3\xA0\x80\x80";

private:
    std::string prefix() const;

    std::string platform_label_;
    bool break_names_;
};

} // namespace rconbridge
