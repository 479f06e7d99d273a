#pragma once
#include "../chat_sink.hpp"
#include "../config.hpp"
#include "../http.hpp"
#include "../model.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace rconbridge {

// EventSub message types (Twitch-Eventsub-Message-Type)
namespace eventsub_message {
    constexpr const char* Notification = "notification";
    constexpr const char* Verification = "webhook_callback_verification";
    constexpr const char* Revocation   = "revocation";
} // namespace eventsub_message

// Build an InboundEvent from a "notification" body. Returns nullopt when the
// body lacks "subscription.type" or the "event" object. Event kinds the
// bridge does not map come back as EventKind::Unknown.
std::optional<InboundEvent> parse_eventsub_notification(const nlohmann::json& body,
                                                        const std::string& platform);

// Posts chat through Helix "Send Chat Message". Messages go out as the
// payload's sender when set, otherwise as the configured bot user.
class TwitchChat : public ChatSink {
public:
    static constexpr size_t RECENT_CAPACITY = 512;
    static constexpr long RATE_LIMIT_RETRY_MS = 500;

    TwitchChat(const TwitchConfig& config, HttpClient& http);

    std::string sink_name() const override { return "twitch"; }
    bool send(const ChatPayload& payload) override;
    bool consume_own_message(const std::string& message_id) override;

    // Longest a consume waits for in-flight sends.
    static constexpr long CONSUME_WAIT_MS = 15000;

    std::string api_url(const std::string& endpoint) const;

private:
    std::vector<Header> headers() const;
    void remember(const std::string& message_id);
    bool post_message(const nlohmann::json& body);

    TwitchConfig config_;
    HttpClient& http_;

    // A notification can arrive before the POST that caused it returns, so
    // consume_own_message waits while sends are in flight. The mutex itself
    // is never held across the request.
    std::mutex sent_mutex_;
    std::condition_variable sent_cv_;
    size_t pending_ = 0;
    std::unordered_set<std::string> recent_;
    std::deque<std::string> recent_order_;
};

// Keeps the EventSub webhook subscriptions for the channel in place. Each
// configured type that has no enabled webhook subscription pointing at the
// callback for the broadcaster is created. Failures are logged and leave the
// other types alone.
class TwitchEventSub {
public:
    TwitchEventSub(const TwitchConfig& config, HttpClient& http);

    // Returns true when every configured type is subscribed afterwards.
    bool ensure_subscriptions(const std::string& callback_url);

    // Creation body for one type, or nullopt for types the bridge cannot set up.
    std::optional<nlohmann::json> subscription_request(const std::string& type,
                                                       const std::string& callback_url) const;

    // Upper bound on pages followed while listing existing subscriptions.
    static constexpr int MAX_PAGES = 20;

private:
    std::optional<bool> exists(const std::string& type, const std::string& callback_url);
    std::vector<Header> headers() const;

    TwitchConfig config_;
    HttpClient& http_;
};

} // namespace rconbridge
