#include "config.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <nlohmann/json.hpp>

namespace rconbridge {

nlohmann::json Config::defaults_json() {
    return {
        {"log_level", "info"},
        {"webhook", {
            {"listen", "127.0.0.1:8000"},
            {"path", "/platform/twitch/eventsub"},
            {"public_url", ""},
            {"max_body", 65536},
            {"inbound_queue_capacity", 1024}
        }},
        {"twitch", {
            {"platform", "twitch"},
            {"alias", ""},
            {"client_id", ""},
            {"access_token", ""},
            {"eventsub_secret", ""},
            {"broadcaster_id", ""},
            {"bot_user_id", ""},
            {"api_base", "https://api.twitch.tv/helix"},
            {"timestamp_tolerance", 600},
            {"eventsub_types", nlohmann::json::array({"channel.chat.message"})},
            {"insert_zws_into_names", false}
        }},
        {"console", {
            {"platform", "factorio"},
            {"alias", ""},
            {"address", "127.0.0.1:27015"},
            {"password", ""},
            {"queue_capacity", 256},
            {"initial_backoff_ms", 500},
            {"max_backoff_ms", 30000},
            {"command_timeout_ms", 5000}
        }},
        {"tail", {
            {"path", ""},
            {"checkpoint_path", ""},
            {"poll_interval_ms", 250},
            {"start_at_end", true}
        }},
        {"identity", {
            {"path", "~/.rconbridge/bridge.db"}
        }},
        {"dedup", {
            {"retention_seconds", 600},
            {"max_entries", 10000}
        }},
        {"commands", {
            {"cheer", nlohmann::json::array({"give {player} {amount}"})},
            {"chat", nlohmann::json::array({"/puppet [{platform}] {speaker} {message}"})}
        }},
        {"exclude_filters", nlohmann::json::array()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object() && key != "commands") {
            // "commands" is user-owned: an operator who removed a kind must not
            // get the default mapping back on the next start
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = obj[key].get<uint32_t>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

static Config parse_config(const nlohmann::json& j) {
    Config cfg;

    read_string(j, "log_level", cfg.log_level);

    if (j.contains("webhook") && j["webhook"].is_object()) {
        auto& w = j["webhook"];
        read_string(w, "listen", cfg.webhook.listen);
        read_string(w, "path", cfg.webhook.path);
        read_string(w, "public_url", cfg.webhook.public_url);
        read_u32(w, "max_body", cfg.webhook.max_body);
        read_u32(w, "inbound_queue_capacity", cfg.webhook.inbound_queue_capacity);
    }

    if (j.contains("twitch") && j["twitch"].is_object()) {
        auto& t = j["twitch"];
        read_string(t, "platform", cfg.twitch.platform);
        read_string(t, "alias", cfg.twitch.alias);
        read_string(t, "client_id", cfg.twitch.client_id);
        read_string(t, "access_token", cfg.twitch.access_token);
        read_string(t, "eventsub_secret", cfg.twitch.eventsub_secret);
        read_string(t, "broadcaster_id", cfg.twitch.broadcaster_id);
        read_string(t, "bot_user_id", cfg.twitch.bot_user_id);
        read_string(t, "api_base", cfg.twitch.api_base);
        read_u32(t, "timestamp_tolerance", cfg.twitch.timestamp_tolerance);
        read_bool(t, "insert_zws_into_names", cfg.twitch.insert_zws_into_names);
        if (t.contains("eventsub_types") && t["eventsub_types"].is_array()) {
            cfg.twitch.eventsub_types.clear();
            for (const auto& type : t["eventsub_types"])
                if (type.is_string()) cfg.twitch.eventsub_types.push_back(type.get<std::string>());
        }
    }

    if (j.contains("console") && j["console"].is_object()) {
        auto& c = j["console"];
        read_string(c, "platform", cfg.console.platform);
        read_string(c, "alias", cfg.console.alias);
        read_string(c, "address", cfg.console.address);
        read_string(c, "password", cfg.console.password);
        read_u32(c, "queue_capacity", cfg.console.queue_capacity);
        read_u32(c, "initial_backoff_ms", cfg.console.initial_backoff_ms);
        read_u32(c, "max_backoff_ms", cfg.console.max_backoff_ms);
        read_u32(c, "command_timeout_ms", cfg.console.command_timeout_ms);
    }

    if (j.contains("tail") && j["tail"].is_object()) {
        auto& t = j["tail"];
        read_string(t, "path", cfg.tail.path);
        read_string(t, "checkpoint_path", cfg.tail.checkpoint_path);
        read_u32(t, "poll_interval_ms", cfg.tail.poll_interval_ms);
        read_bool(t, "start_at_end", cfg.tail.start_at_end);
    }

    if (j.contains("identity") && j["identity"].is_object())
        read_string(j["identity"], "path", cfg.identity.path);

    if (j.contains("dedup") && j["dedup"].is_object()) {
        read_u32(j["dedup"], "retention_seconds", cfg.dedup.retention_seconds);
        read_u32(j["dedup"], "max_entries", cfg.dedup.max_entries);
    }

    if (j.contains("commands") && j["commands"].is_object()) {
        for (auto& [kind, templates] : j["commands"].items()) {
            std::vector<std::string> list;
            if (templates.is_string()) {
                list.push_back(templates.get<std::string>());
            } else if (templates.is_array()) {
                for (const auto& t : templates)
                    if (t.is_string()) list.push_back(t.get<std::string>());
            }
            cfg.commands[kind] = std::move(list);
        }
    }

    if (j.contains("exclude_filters") && j["exclude_filters"].is_array()) {
        for (const auto& f : j["exclude_filters"])
            if (f.is_string()) cfg.exclude_filters.push_back(f.get<std::string>());
    }

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.rconbridge/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    log_info("config", "Migrated config with new defaults: " + config_path);
            }
        } catch (const nlohmann::json::exception& e) {
            log_warn("config", "Malformed config " + config_path + " (" + e.what() +
                               "), using defaults");
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            log_info("config", "Created default config: " + config_path);
    }

    Config cfg = parse_config(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("TWITCH_CLIENT_ID"))
        cfg.twitch.client_id = v;
    if (const char* v = std::getenv("TWITCH_ACCESS_TOKEN"))
        cfg.twitch.access_token = v;
    if (const char* v = std::getenv("TWITCH_EVENTSUB_SECRET"))
        cfg.twitch.eventsub_secret = v;
    if (const char* v = std::getenv("RCON_ADDRESS"))
        cfg.console.address = v;
    if (const char* v = std::getenv("RCON_PASSWORD"))
        cfg.console.password = v;
    if (const char* v = std::getenv("BRIDGE_LOG_PATH"))
        cfg.tail.path = v;
    if (const char* v = std::getenv("BRIDGE_DB_PATH"))
        cfg.identity.path = v;
    if (const char* v = std::getenv("RCONBRIDGE_LOG_LEVEL"))
        cfg.log_level = v;

    if (!cfg.tail.path.empty()) cfg.tail.path = expand_home(cfg.tail.path);
    cfg.identity.path = expand_home(cfg.identity.path);

    return cfg;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    if (twitch.eventsub_secret.size() < 10 || twitch.eventsub_secret.size() > 100)
        problems.push_back("twitch.eventsub_secret must be 10-100 characters");
    if (twitch.broadcaster_id.empty())
        problems.push_back("twitch.broadcaster_id is not set");
    if (twitch.client_id.empty() || twitch.access_token.empty())
        problems.push_back("twitch.client_id and twitch.access_token are required to send chat");
    if (twitch.bot_user_id.empty())
        problems.push_back("twitch.bot_user_id is not set");
    std::string host;
    uint16_t port = 0;
    if (!parse_host_port(webhook.listen, host, port))
        problems.push_back("webhook.listen must be host:port");
    if (!parse_host_port(console.address, host, port))
        problems.push_back("console.address must be host:port");
    if (console.password.empty())
        problems.push_back("console.password is not set");
    if (tail.path.empty())
        problems.push_back("tail.path is not set");
    if (console.queue_capacity == 0)
        problems.push_back("console.queue_capacity must be positive");
    if (console.initial_backoff_ms == 0 || console.max_backoff_ms < console.initial_backoff_ms)
        problems.push_back("console backoff must satisfy 0 < initial_backoff_ms <= max_backoff_ms");
    if (webhook.inbound_queue_capacity == 0)
        problems.push_back("webhook.inbound_queue_capacity must be positive");
    if (!webhook.public_url.empty() && webhook.public_url.rfind("https://", 0) != 0)
        problems.push_back("webhook.public_url must start with https://");
    for (const auto& f : exclude_filters) {
        try {
            std::regex re(f);
        } catch (const std::regex_error&) {
            problems.push_back("exclude_filters: invalid regex '" + f + "'");
        }
    }
    return problems;
}

std::string Config::checkpoint_path() const {
    if (!tail.checkpoint_path.empty()) return expand_home(tail.checkpoint_path);
    return expand_home(tail.path) + ".offset";
}

} // namespace rconbridge
