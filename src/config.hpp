#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace rconbridge {

struct WebhookConfig {
    std::string listen = "127.0.0.1:8000";
    std::string path = "/platform/twitch/eventsub";
    std::string public_url;  // externally reachable base; empty = subscriptions managed by hand
    uint32_t max_body = 65536;
    uint32_t inbound_queue_capacity = 1024;
};

struct TwitchConfig {
    std::string platform = "twitch";  // platform id used in identity links
    std::string alias;                // label in relayed text; empty = platform
    std::string client_id;
    std::string access_token;         // obtained out of band
    std::string eventsub_secret;
    std::string broadcaster_id;       // channel the bridge posts into
    std::string bot_user_id;          // default sender when no identity resolves
    std::string api_base = "https://api.twitch.tv/helix";
    uint32_t timestamp_tolerance = 600;  // seconds; older deliveries are rejected
    std::vector<std::string> eventsub_types = {"channel.chat.message"};
    bool insert_zws_into_names = false;  // keep relayed game names from pinging viewers

    const std::string& label() const { return alias.empty() ? platform : alias; }
};

struct ConsoleConfig {
    std::string platform = "factorio";
    std::string alias;
    std::string address = "127.0.0.1:27015";
    std::string password;
    uint32_t queue_capacity = 256;
    uint32_t initial_backoff_ms = 500;
    uint32_t max_backoff_ms = 30000;
    uint32_t command_timeout_ms = 5000;

    const std::string& label() const { return alias.empty() ? platform : alias; }
};

struct TailConfig {
    std::string path;             // bridge output log written by the game
    std::string checkpoint_path;  // empty = <path>.offset
    uint32_t poll_interval_ms = 250;
    bool start_at_end = true;     // without a checkpoint, skip existing history
};

struct IdentityConfig {
    std::string path = "~/.rconbridge/bridge.db";
};

struct DedupConfig {
    uint32_t retention_seconds = 600;
    uint32_t max_entries = 10000;
};

struct Config {
    std::string log_level = "info";

    WebhookConfig webhook;
    TwitchConfig twitch;
    ConsoleConfig console;
    TailConfig tail;
    IdentityConfig identity;
    DedupConfig dedup;

    // Event kind name -> console command templates, applied in order
    std::unordered_map<std::string, std::vector<std::string>> commands;

    // ECMAScript regexes; relayed text matching any of them is dropped
    std::vector<std::string> exclude_filters;

    // Load from ~/.rconbridge/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults when missing)
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Human-readable list of problems that prevent startup (empty = ok)
    std::vector<std::string> validate() const;

    // Checkpoint path with the default applied
    std::string checkpoint_path() const;
};

} // namespace rconbridge
