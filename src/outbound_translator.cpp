#include "outbound_translator.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cctype>

namespace rconbridge {

static bool has_date_stamp(const std::string& line) {
    // "2024-03-21 20:39:14 "
    if (line.size() < 20) return false;
    static const char* shape = "dddd-dd-dd dd:dd:dd ";
    for (size_t i = 0; i < 20; ++i) {
        char want = shape[i];
        char c = line[i];
        if (want == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        } else if (c != want) {
            return false;
        }
    }
    return true;
}

std::optional<LogLineEvent> parse_log_line(const LogEvent& event) {
    std::string line = event.raw_line;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (has_date_stamp(line)) line = line.substr(20);
    line = trim(line);
    if (line.empty()) return std::nullopt;

    LogLineEvent out;
    out.source = event;

    auto space = line.find(' ');
    std::string tag = line.substr(0, space);
    std::string contents = space == std::string::npos ? "" : line.substr(space + 1);
    if (tag.size() >= 2 && tag.front() == '[' && tag.back() == ']') {
        tag = tag.substr(1, tag.size() - 2);
    }
    for (auto& c : tag) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    out.tag = tag;

    if (tag == "CHAT") {
        auto sep = contents.find(": ");
        if (sep == std::string::npos || sep == 0) {
            log_warn("outbound", "Could not process line '" + event.raw_line +
                                 "', expected 'name: text'");
            return std::nullopt;
        }
        out.kind = LogLineKind::Chat;
        out.actor = contents.substr(0, sep);
        out.text = contents.substr(sep + 2);
        return out;
    }

    if (tag == "JOIN" || tag == "LEAVE") {
        out.kind = tag == "JOIN" ? LogLineKind::Join : LogLineKind::Leave;
        out.actor = contents.substr(0, contents.find(' '));
        out.text = contents;
        return out;
    }

    if (tag == "PLAYERLIST") {
        out.kind = LogLineKind::PlayerList;
        for (const auto& entry : split(contents, ';')) {
            std::string e = trim(entry);
            if (e.empty()) continue;
            auto sp = e.find(' ');
            if (sp == std::string::npos) {
                out.players.emplace_back(e, "");
            } else {
                out.players.emplace_back(e.substr(0, sp), trim(e.substr(sp + 1)));
            }
        }
        out.text = contents;
        return out;
    }

    out.kind = contents.empty() ? LogLineKind::Unknown : LogLineKind::Notice;
    out.text = contents;
    return out;
}

OutboundTranslator::OutboundTranslator(std::string platform_label, bool break_names)
    : platform_label_(std::move(platform_label)), break_names_(break_names) {}

std::string OutboundTranslator::break_name(const std::string& name) {
    if (name.empty()) return name;
    size_t first = 1;
    while (first < name.size() && (static_cast<unsigned char>(name[first]) & 0xC0) == 0x80) ++first;
    if (first >= name.size()) return name;
    return name.substr(0, first) + NAME_BREAK + name.substr(first);
}

std::string OutboundTranslator::prefix() const {
    return "[" + platform_label_ + "] ";
}

bool OutboundTranslator::requires_identity(const LogLineEvent& line) const {
    return line.kind == LogLineKind::Chat && line.actor != SERVER_ACTOR;
}

std::string OutboundTranslator::format_player_list(
        const std::vector<std::pair<std::string, std::string>>& players,
        bool break_names) {
    if (players.empty()) return "No players online";
    std::string out;
    for (const auto& [raw_name, raw_surface] : players) {
        std::string name = break_names ? break_name(raw_name) : raw_name;
        std::string surface = raw_surface;
        // The home planet is reported lowercase
        if (surface == "nauvis") surface = "Nauvis";
        if (!out.empty()) out += ", ";
        out += surface.empty() ? name : name + " is on " + surface;
    }
    return out;
}

std::vector<ChatPayload> OutboundTranslator::translate(
        const LogLineEvent& line,
        const std::optional<Identity>& sender) const {
    std::vector<ChatPayload> out;
    ChatPayload payload;
    payload.origin = line.source.raw_line;

    switch (line.kind) {
        case LogLineKind::Chat:
            if (line.actor == SERVER_ACTOR || !sender || line.text.empty()) return out;
            payload.text = prefix() + line.text;
            payload.sender_user_id = sender->user_id;
            break;
        case LogLineKind::Join:
        case LogLineKind::Leave:
            if (break_names_ && !line.actor.empty() && line.text.rfind(line.actor, 0) == 0) {
                payload.text = prefix() + break_name(line.actor) + line.text.substr(line.actor.size());
            } else {
                payload.text = prefix() + line.text;
            }
            break;
        case LogLineKind::Notice:
            payload.text = prefix() + line.text;
            break;
        case LogLineKind::PlayerList:
            payload.text = prefix() + format_player_list(line.players, break_names_);
            break;
        default:
            return out;
    }

    out.push_back(std::move(payload));
    return out;
}

} // namespace rconbridge
