#include "command_translator.hpp"
#include "util.hpp"

#include <cctype>

namespace rconbridge {

std::string sanitize_console_text(const std::string& text, size_t max_len) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (c < 0x20 || c == 0x7f) continue;
        if (c == '\\' || c == '"') out += '\\';
        out += static_cast<char>(c);
    }
    if (out.size() > max_len) {
        size_t cut = max_len;
        // Back up over UTF-8 continuation bytes
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) --cut;
        // Never leave a dangling escape backslash
        size_t slashes = 0;
        while (slashes < cut && out[cut - 1 - slashes] == '\\') ++slashes;
        if (slashes % 2 == 1) --cut;
        out.resize(cut);
    }
    return out;
}

std::string sanitize_identifier(const std::string& text) {
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '_' || c == '-' || c == '.') {
            out += static_cast<char>(c);
            if (out.size() == 64) break;
        }
    }
    return out;
}

std::string expand_template(const std::string& tmpl,
                            const std::unordered_map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tmpl.size() + 32);
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i + 1);
            if (close != std::string::npos) {
                auto it = values.find(tmpl.substr(i + 1, close - i - 1));
                if (it != values.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += tmpl[i++];
    }
    return out;
}

CommandTranslator::CommandTranslator(Templates templates, std::string platform_label)
    : templates_(std::move(templates)), platform_label_(std::move(platform_label)) {}

const std::vector<std::string>* CommandTranslator::templates_for(EventKind kind) const {
    if (kind == EventKind::Unknown) return nullptr;
    auto it = templates_.find(event_kind_name(kind));
    if (it == templates_.end() || it->second.empty()) return nullptr;
    return &it->second;
}

static bool is_player_list_request(const std::string& message) {
    std::string m = trim(message);
    return m == "/players" || starts_with(m, "/players ");
}

std::vector<ConsoleCommand> CommandTranslator::translate(
        const InboundEvent& event,
        const std::optional<Identity>& player) const {
    std::vector<ConsoleCommand> out;

    switch (event.kind) {
        case EventKind::Chat:
            if (is_player_list_request(event.message)) {
                out.push_back({PLAYER_LIST_COMMAND, event.fingerprint});
                return out;
            }
            break;
        case EventKind::Cheer:
        case EventKind::Subscribe:
        case EventKind::GiftSubscription:
        case EventKind::Follow:
        case EventKind::Redemption:
            break;
        default:
            return out;
    }

    const auto* list = templates_for(event.kind);
    if (!list) return out;

    std::string name = sanitize_identifier(event.user_name);
    std::string color = sanitize_identifier(event.color);
    if (color.size() != 6) color.clear();

    std::unordered_map<std::string, std::string> values = {
        {"platform",  sanitize_identifier(platform_label_)},
        {"user_id",   sanitize_identifier(event.source_user_id)},
        {"user_name", name},
        {"speaker",   color.empty() ? name + ":" : "[color=#" + color + "]" + name + ":[/color]"},
        {"message",   sanitize_console_text(event.message)},
        {"amount",    std::to_string(event.amount)},
        {"tier",      sanitize_identifier(event.tier)},
        {"reward",    sanitize_console_text(event.reward, 80)},
        {"color",     color},
    };
    if (player) values["player"] = sanitize_identifier(player->user_id);

    for (const auto& tmpl : *list) {
        bool needs_player = tmpl.find("{player}") != std::string::npos;
        if (needs_player && (!player || values["player"].empty())) continue;
        std::string text = trim(expand_template(tmpl, values));
        if (!text.empty()) out.push_back({std::move(text), event.fingerprint});
    }
    return out;
}

} // namespace rconbridge
