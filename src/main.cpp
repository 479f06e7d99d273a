#include "config.hpp"
#include "console_session.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "identity/sqlite_identity_store.hpp"
#include "log.hpp"
#include "log_tailer.hpp"
#include "platforms/twitch.hpp"
#include "relay.hpp"
#include "webhook_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: rconbridge [options]\n"
              << "\n"
              << "Relays Twitch EventSub events into a game server console over RCON,\n"
              << "and the game's bridge log back into Twitch chat.\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH                 Config file (default ~/.rconbridge/config.json)\n"
              << "  --link SRC DST                Link two identities (platform:user_id) and exit\n"
              << "  -h, --help                    Show this help\n"
              << "\n"
              << "Example:\n"
              << "  rconbridge --link twitch:12345 factorio:Steve\n"
              << "\n"
              << "Environment variables:\n"
              << "  TWITCH_CLIENT_ID        Helix client id\n"
              << "  TWITCH_ACCESS_TOKEN     Helix user access token\n"
              << "  TWITCH_EVENTSUB_SECRET  EventSub webhook secret\n"
              << "  RCON_ADDRESS            Console address (host:port)\n"
              << "  RCON_PASSWORD           Console password\n"
              << "  BRIDGE_LOG_PATH         Bridge log file written by the game\n"
              << "  BRIDGE_DB_PATH          Identity link database\n"
              << "  RCONBRIDGE_LOG_LEVEL    debug, info, warn or error\n";
}

// "platform:user_id"
static bool parse_identity(const std::string& s, rconbridge::Identity& out) {
    auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == s.size()) return false;
    out.platform = s.substr(0, colon);
    out.user_id = s.substr(colon + 1);
    return true;
}

static int run_link(const rconbridge::Config& config,
                    const std::string& src, const std::string& dst) {
    rconbridge::Identity from, to;
    if (!parse_identity(src, from) || !parse_identity(dst, to)) {
        std::cerr << "Error: identities must look like platform:user_id\n";
        return 1;
    }
    rconbridge::SqliteIdentityStore store(config.identity.path);
    store.upsert({from.platform, from.user_id, to.platform, to.user_id});
    std::cout << "Linked " << src << " -> " << dst << "\n";
    return 0;
}

static int run_bridge(const rconbridge::Config& config) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    rconbridge::http_set_abort_flag(&g_shutdown);

    rconbridge::EventBus bus;
    rconbridge::subscribe<rconbridge::ConsoleStateChangedEvent>(bus,
        [](const rconbridge::ConsoleStateChangedEvent& ev) {
            if (ev.current == rconbridge::ConsoleState::AuthRejected) {
                std::cerr << "\n"
                          << "*** The game server rejected the RCON password (" << ev.detail << ").\n"
                          << "*** Stream events will not reach the game until the password is fixed\n"
                          << "*** and rconbridge is restarted.\n\n";
            }
        });
    rconbridge::subscribe<rconbridge::LogRotatedEvent>(bus,
        [](const rconbridge::LogRotatedEvent& ev) {
            rconbridge::log_info("main", ev.path + " rotation #" + std::to_string(ev.rotations));
        });

    rconbridge::SqliteIdentityStore identities(config.identity.path);
    rconbridge::log_info("main", "Identity links: " + std::to_string(identities.count()) +
                                 " (" + identities.backend_name() + ")");

    rconbridge::CurlHttpClient http_client;
    rconbridge::TwitchChat chat(config.twitch, http_client);

    rconbridge::ConsoleSession console(config.console,
                                       rconbridge::ConsoleSession::tcp_connector(config.console),
                                       &bus);
    rconbridge::LogTailer tailer(config.tail.path, config.checkpoint_path(),
                                 config.tail.start_at_end, &bus);
    rconbridge::RelayOrchestrator relay(config, identities, console, chat, tailer, &bus);

    rconbridge::WebhookServer server(config.webhook.listen, config.webhook.max_body,
        [&relay](const rconbridge::WebhookRequest& req) { return relay.handle_webhook(req); });

    std::string error;
    console.start();
    relay.start();
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        relay.stop();
        console.stop();
        return 1;
    }

    if (!config.webhook.public_url.empty()) {
        std::string base = config.webhook.public_url;
        while (!base.empty() && base.back() == '/') base.pop_back();
        rconbridge::TwitchEventSub eventsub(config.twitch, http_client);
        if (!eventsub.ensure_subscriptions(base + config.webhook.path)) {
            rconbridge::log_warn("main", "Some EventSub subscriptions are missing; "
                                         "events of those types will not arrive");
        }
    }

    std::cerr << "[main] Bridge running. Webhook path " << config.webhook.path
              << ", console " << config.console.address
              << ", log " << config.tail.path << "\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[main] Shutting down.\n";
    server.stop();
    relay.stop();
    console.stop();

    std::cerr << "[main] Relayed " << relay.count(rconbridge::RelayOutcome::Relayed)
              << ", duplicates " << relay.count(rconbridge::RelayOutcome::DuplicateEvent)
              << ", unresolved " << relay.count(rconbridge::RelayOutcome::UnresolvedIdentity)
              << ", console commands " << console.executed()
              << ", log rotations " << tailer.rotations() << "\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string link_src;
    std::string link_dst;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--link") == 0 && i + 2 < argc) {
            link_src = argv[++i];
            link_dst = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? rconbridge::Config::load()
                                      : rconbridge::Config::load_from(config_path);
    rconbridge::set_log_level(rconbridge::parse_log_level(config.log_level));

    if (!link_src.empty()) {
        return run_link(config, link_src, link_dst);
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        std::cerr << "Configuration errors:\n";
        for (const auto& p : problems) std::cerr << "  - " << p << "\n";
        return 1;
    }

    rconbridge::http_init();
    int rc = run_bridge(config);
    rconbridge::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
