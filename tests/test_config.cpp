#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace rconbridge;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.webhook.path == "/platform/twitch/eventsub");
    REQUIRE(cfg.twitch.timestamp_tolerance == 600);
    REQUIRE(cfg.console.address == "127.0.0.1:27015");
    REQUIRE(cfg.console.initial_backoff_ms == 500);
    REQUIRE(cfg.dedup.retention_seconds == 600);
    REQUIRE(cfg.dedup.max_entries == 10000);
    REQUIRE(cfg.tail.start_at_end);
    REQUIRE(cfg.webhook.public_url.empty());
    REQUIRE(cfg.twitch.eventsub_types == std::vector<std::string>{"channel.chat.message"});
    REQUIRE_FALSE(cfg.twitch.insert_zws_into_names);
}

TEST_CASE("Config: labels fall back to the platform id", "[config]") {
    Config cfg;
    REQUIRE(cfg.twitch.label() == "twitch");
    REQUIRE(cfg.console.label() == "factorio");
    cfg.console.alias = "SpaceAge";
    REQUIRE(cfg.console.label() == "SpaceAge");
}

TEST_CASE("Config::checkpoint_path: defaults next to the log", "[config]") {
    Config cfg;
    cfg.tail.path = "/var/log/factorio/bridge.log";
    REQUIRE(cfg.checkpoint_path() == "/var/log/factorio/bridge.log.offset");
    cfg.tail.checkpoint_path = "/var/lib/rconbridge/offset.json";
    REQUIRE(cfg.checkpoint_path() == "/var/lib/rconbridge/offset.json");
}

// ── validate ─────────────────────────────────────────────────────

static Config valid_config() {
    Config cfg;
    cfg.twitch.client_id = "client";
    cfg.twitch.access_token = "token";
    cfg.twitch.eventsub_secret = "0123456789abcdef";
    cfg.twitch.broadcaster_id = "1000";
    cfg.twitch.bot_user_id = "2000";
    cfg.console.password = "hunter2";
    cfg.tail.path = "/tmp/bridge.log";
    return cfg;
}

TEST_CASE("Config::validate: complete config has no problems", "[config]") {
    REQUIRE(valid_config().validate().empty());
}

TEST_CASE("Config::validate: reports each missing setting", "[config]") {
    Config cfg;
    auto problems = cfg.validate();
    // secret, broadcaster, client/token, bot user, password, tail path
    REQUIRE(problems.size() == 6);
}

TEST_CASE("Config::validate: secret length bounds", "[config]") {
    Config cfg = valid_config();
    cfg.twitch.eventsub_secret = "short";
    REQUIRE(cfg.validate().size() == 1);
    cfg.twitch.eventsub_secret = std::string(101, 'x');
    REQUIRE(cfg.validate().size() == 1);
}

TEST_CASE("Config::validate: bad addresses, backoff and filters", "[config]") {
    Config cfg = valid_config();
    cfg.console.address = "no-port";
    cfg.webhook.listen = "127.0.0.1:99999";
    cfg.console.initial_backoff_ms = 5000;
    cfg.console.max_backoff_ms = 100;
    cfg.exclude_filters = {"^ok$", "(unclosed"};
    REQUIRE(cfg.validate().size() == 4);
}

TEST_CASE("Config::validate: public_url must be https", "[config]") {
    Config cfg = valid_config();
    cfg.webhook.public_url = "http://bridge.example.org";
    REQUIRE(cfg.validate().size() == 1);
    cfg.webhook.public_url = "https://bridge.example.org";
    REQUIRE(cfg.validate().empty());
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "rconbridge_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* ENV_VARS[] = {
    "TWITCH_CLIENT_ID", "TWITCH_ACCESS_TOKEN", "TWITCH_EVENTSUB_SECRET",
    "RCON_ADDRESS", "RCON_PASSWORD", "BRIDGE_LOG_PATH", "BRIDGE_DB_PATH",
    "RCONBRIDGE_LOG_LEVEL"
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* v : ENV_VARS) unsetenv(v);
    }

    ~ConfigTestGuard() {
        for (const char* v : ENV_VARS) unsetenv(v);
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.rconbridge/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.rconbridge");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string((std::istreambuf_iterator<char>(f)),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"json({
        "log_level": "debug",
        "webhook": { "listen": "0.0.0.0:9000", "max_body": 1024,
                     "public_url": "https://bridge.example.org" },
        "twitch": { "eventsub_secret": "file-secret-123", "broadcaster_id": "42", "alias": "TTV",
                    "eventsub_types": ["channel.cheer", "channel.follow"],
                    "insert_zws_into_names": true },
        "console": { "address": "10.0.0.5:34198", "password": "pw", "queue_capacity": 8 },
        "tail": { "path": "/srv/factorio/bridge.log", "start_at_end": false },
        "commands": { "follow": "/c game.print(\"{user_name} followed\")" },
        "exclude_filters": ["^!"]
    })json");

    Config cfg = Config::load();

    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.webhook.listen == "0.0.0.0:9000");
    REQUIRE(cfg.webhook.max_body == 1024);
    REQUIRE(cfg.twitch.eventsub_secret == "file-secret-123");
    REQUIRE(cfg.twitch.broadcaster_id == "42");
    REQUIRE(cfg.twitch.label() == "TTV");
    REQUIRE(cfg.webhook.public_url == "https://bridge.example.org");
    REQUIRE(cfg.twitch.eventsub_types ==
            std::vector<std::string>{"channel.cheer", "channel.follow"});
    REQUIRE(cfg.twitch.insert_zws_into_names);
    REQUIRE(cfg.console.address == "10.0.0.5:34198");
    REQUIRE(cfg.console.queue_capacity == 8);
    REQUIRE(cfg.tail.path == "/srv/factorio/bridge.log");
    REQUIRE_FALSE(cfg.tail.start_at_end);
    REQUIRE(cfg.commands["follow"].size() == 1);
    REQUIRE(cfg.exclude_filters == std::vector<std::string>{"^!"});
}

TEST_CASE("Config::load: user command map is not refilled with defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"commands": {"follow": ["say hi"]}})");

    Config cfg = Config::load();
    REQUIRE(cfg.commands.count("follow") == 1);
    REQUIRE(cfg.commands.count("cheer") == 0);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"console": {"password": "from-file"}})");
    setenv("RCON_PASSWORD", "from-env", 1);
    setenv("TWITCH_EVENTSUB_SECRET", "env-secret-0001", 1);
    setenv("BRIDGE_LOG_PATH", "~/bridge.log", 1);
    setenv("RCONBRIDGE_LOG_LEVEL", "warn", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.console.password == "from-env");
    REQUIRE(cfg.twitch.eventsub_secret == "env-secret-0001");
    REQUIRE(cfg.tail.path == g.dir + "/bridge.log");
    REQUIRE(cfg.log_level == "warn");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.console.address == "127.0.0.1:27015");
    REQUIRE(cfg.commands.count("cheer") == 1);
}

TEST_CASE("Config::load: missing config file uses and writes defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.commands["cheer"] == std::vector<std::string>{"give {player} {amount}"});
    REQUIRE(cfg.commands["chat"] ==
            std::vector<std::string>{"/puppet [{platform}] {speaker} {message}"});
    REQUIRE(cfg.identity.path == g.dir + "/.rconbridge/bridge.db");

    REQUIRE(std::filesystem::exists(g.config_path()));
    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["console"]["address"] == "127.0.0.1:27015");
    REQUIRE(j["twitch"]["timestamp_tolerance"] == 600);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"console": {"password": "keep-me"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.console.password == "keep-me");

    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["console"]["password"] == "keep-me");
    REQUIRE(j["console"]["max_backoff_ms"] == 30000);
    REQUIRE(j.contains("dedup"));
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["console"]["password"] = "secret";
    g.write_config(full.dump(4) + "\n");
    std::string before = g.read_config();

    Config cfg = Config::load();
    REQUIRE(cfg.console.password == "secret");
    REQUIRE(g.read_config() == before);
}

TEST_CASE("Config::load_from: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom/bridge.json";
    std::filesystem::create_directories(g.dir + "/custom");
    {
        std::ofstream f(path);
        f << R"({"webhook": {"path": "/hooks/twitch"}})";
    }

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.webhook.path == "/hooks/twitch");
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}
