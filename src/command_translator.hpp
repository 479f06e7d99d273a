#pragma once
#include "model.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rconbridge {

// Free text bound for the console: control characters (CR, LF, NUL, DEL, ...)
// are removed, backslash and double quote are escaped, and the result is cut
// to max_len bytes without splitting a UTF-8 sequence.
std::string sanitize_console_text(const std::string& text, size_t max_len = 240);

// Names and ids: only [A-Za-z0-9_.-], at most 64 characters.
std::string sanitize_identifier(const std::string& text);

// Replace {key} placeholders; unknown placeholders are left verbatim.
std::string expand_template(const std::string& tmpl,
                            const std::unordered_map<std::string, std::string>& values);

// Stream event -> console commands. Templates are keyed by event kind name
// ("cheer", "chat", ...). A kind with no templates, and EventKind::Unknown,
// translate to nothing.
class CommandTranslator {
public:
    using Templates = std::unordered_map<std::string, std::vector<std::string>>;

    CommandTranslator(Templates templates, std::string platform_label);

    std::vector<ConsoleCommand> translate(const InboundEvent& event,
                                          const std::optional<Identity>& player) const;

    static constexpr const char* PLAYER_LIST_COMMAND = "/bridge-player-list";

private:
    const std::vector<std::string>* templates_for(EventKind kind) const;

    Templates templates_;
    std::string platform_label_;
};

} // namespace rconbridge
