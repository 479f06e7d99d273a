#include "twitch.hpp"
#include "../log.hpp"

#include <chrono>
#include <thread>

namespace rconbridge {

static std::string str_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static int64_t int_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) return 0;
    return it->get<int64_t>();
}

std::optional<InboundEvent> parse_eventsub_notification(const nlohmann::json& body,
                                                        const std::string& platform) {
    if (!body.is_object()) return std::nullopt;
    auto sub = body.find("subscription");
    auto evt = body.find("event");
    if (sub == body.end() || !sub->is_object() || evt == body.end() || !evt->is_object()) {
        return std::nullopt;
    }
    std::string type = str_field(*sub, "type");
    if (type.empty()) return std::nullopt;

    InboundEvent ev;
    ev.source_platform = platform;
    ev.subscription_type = type;
    ev.kind = event_kind_from_subscription(type);
    ev.payload = *evt;

    const auto& e = *evt;
    switch (ev.kind) {
        case EventKind::Chat: {
            ev.source_user_id = str_field(e, "chatter_user_id");
            ev.user_name = str_field(e, "chatter_user_name");
            ev.message_id = str_field(e, "message_id");
            auto msg = e.find("message");
            if (msg != e.end() && msg->is_object()) ev.message = str_field(*msg, "text");
            ev.color = str_field(e, "color");
            if (!ev.color.empty() && ev.color[0] == '#') ev.color.erase(0, 1);
            break;
        }
        case EventKind::Cheer:
            ev.source_user_id = str_field(e, "user_id");
            ev.user_name = str_field(e, "user_name");
            ev.amount = int_field(e, "bits");
            ev.message = str_field(e, "message");
            break;
        case EventKind::Subscribe:
            ev.source_user_id = str_field(e, "user_id");
            ev.user_name = str_field(e, "user_name");
            ev.tier = str_field(e, "tier");
            break;
        case EventKind::GiftSubscription:
            ev.source_user_id = str_field(e, "user_id");
            ev.user_name = str_field(e, "user_name");
            ev.tier = str_field(e, "tier");
            ev.amount = int_field(e, "total");
            break;
        case EventKind::Follow:
            ev.source_user_id = str_field(e, "user_id");
            ev.user_name = str_field(e, "user_name");
            break;
        case EventKind::Redemption: {
            ev.source_user_id = str_field(e, "user_id");
            ev.user_name = str_field(e, "user_name");
            ev.message = str_field(e, "user_input");
            auto reward = e.find("reward");
            if (reward != e.end() && reward->is_object()) ev.reward = str_field(*reward, "title");
            break;
        }
        default:
            ev.source_user_id = str_field(e, "user_id");
            ev.user_name = str_field(e, "user_name");
            break;
    }
    return ev;
}

// ── TwitchChat ───────────────────────────────────────────────

TwitchChat::TwitchChat(const TwitchConfig& config, HttpClient& http)
    : config_(config), http_(http) {}

std::string TwitchChat::api_url(const std::string& endpoint) const {
    std::string base = config_.api_base;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + endpoint;
}

std::vector<Header> TwitchChat::headers() const {
    return {
        {"Client-Id", config_.client_id},
        {"Authorization", "Bearer " + config_.access_token},
        {"Content-Type", "application/json"}
    };
}

void TwitchChat::remember(const std::string& message_id) {
    if (message_id.empty() || !recent_.insert(message_id).second) return;
    recent_order_.push_back(message_id);
    while (recent_order_.size() > RECENT_CAPACITY) {
        recent_.erase(recent_order_.front());
        recent_order_.pop_front();
    }
}

bool TwitchChat::consume_own_message(const std::string& message_id) {
    std::unique_lock<std::mutex> lock(sent_mutex_);
    sent_cv_.wait_for(lock, std::chrono::milliseconds(CONSUME_WAIT_MS), [&] {
        return recent_.count(message_id) > 0 || pending_ == 0;
    });
    // Leaves a stale id in recent_order_; it ages out with the others
    return recent_.erase(message_id) > 0;
}

bool TwitchChat::send(const ChatPayload& payload) {
    std::string sender = payload.sender_user_id ? *payload.sender_user_id : config_.bot_user_id;
    nlohmann::json body = {
        {"broadcaster_id", config_.broadcaster_id},
        {"sender_id", sender},
        {"message", payload.text}
    };

    {
        std::lock_guard<std::mutex> lock(sent_mutex_);
        ++pending_;
    }
    bool ok = post_message(body);
    {
        std::lock_guard<std::mutex> lock(sent_mutex_);
        --pending_;
    }
    sent_cv_.notify_all();
    return ok;
}

bool TwitchChat::post_message(const nlohmann::json& body) {
    std::string url = api_url("chat/messages");
    HttpResponse resp = http_.post(url, body.dump(), headers());
    if (resp.status_code == 429) {
        log_warn("twitch", "Rate limited, retrying in " +
                           std::to_string(RATE_LIMIT_RETRY_MS) + "ms");
        std::this_thread::sleep_for(std::chrono::milliseconds(RATE_LIMIT_RETRY_MS));
        resp = http_.post(url, body.dump(), headers());
    }

    if (resp.status_code == 0) {
        log_error("twitch", "Send failed: " + resp.error);
        return false;
    }
    if (resp.status_code != 200) {
        log_error("twitch", "Send failed with HTTP " + std::to_string(resp.status_code) +
                            ": " + resp.body);
        return false;
    }

    try {
        auto j = nlohmann::json::parse(resp.body);
        const auto& data = j.at("data").at(0);
        std::string id = str_field(data, "message_id");
        {
            std::lock_guard<std::mutex> lock(sent_mutex_);
            remember(id);
        }
        sent_cv_.notify_all();
        if (!data.value("is_sent", false)) {
            std::string reason = data.contains("drop_reason") ? data["drop_reason"].dump() : "unknown";
            log_error("twitch", "Message was not sent: " + reason);
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        log_error("twitch", std::string("Unexpected send response: ") + e.what());
        return false;
    }
    return true;
}

// ── TwitchEventSub ───────────────────────────────────────────

TwitchEventSub::TwitchEventSub(const TwitchConfig& config, HttpClient& http)
    : config_(config), http_(http) {}

std::vector<Header> TwitchEventSub::headers() const {
    return {
        {"Client-Id", config_.client_id},
        {"Authorization", "Bearer " + config_.access_token},
        {"Content-Type", "application/json"}
    };
}

std::optional<nlohmann::json> TwitchEventSub::subscription_request(
        const std::string& type, const std::string& callback_url) const {
    std::string version = "1";
    nlohmann::json condition = {{"broadcaster_user_id", config_.broadcaster_id}};
    if (type == "channel.chat.message") {
        condition["user_id"] = config_.bot_user_id;
    } else if (type == "channel.follow") {
        version = "2";
        condition["moderator_user_id"] = config_.bot_user_id;
    } else if (type != "channel.cheer" && type != "channel.subscribe" &&
               type != "channel.subscription.gift" &&
               type != "channel.channel_points_custom_reward_redemption.add") {
        return std::nullopt;
    }
    return nlohmann::json{
        {"type", type},
        {"version", version},
        {"condition", condition},
        {"transport", {
            {"method", "webhook"},
            {"callback", callback_url},
            {"secret", config_.eventsub_secret}
        }}
    };
}

// true/false once the listing was read, nullopt when it could not be.
std::optional<bool> TwitchEventSub::exists(const std::string& type,
                                           const std::string& callback_url) {
    std::string base = config_.api_base;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string url = base + "/eventsub/subscriptions?status=enabled&type=" + type;

    std::string cursor;
    for (int page = 0; page < MAX_PAGES; ++page) {
        HttpResponse resp = http_.get(cursor.empty() ? url : url + "&after=" + cursor, headers());
        if (resp.status_code != 200) {
            log_error("twitch", "Listing " + type + " subscriptions failed: " +
                                (resp.status_code == 0 ? resp.error
                                                       : "HTTP " + std::to_string(resp.status_code)));
            return std::nullopt;
        }
        try {
            auto j = nlohmann::json::parse(resp.body);
            for (const auto& sub : j.at("data")) {
                const auto& transport = sub.at("transport");
                if (str_field(transport, "method") != "webhook") continue;
                if (str_field(transport, "callback") != callback_url) continue;
                if (str_field(sub.at("condition"), "broadcaster_user_id") == config_.broadcaster_id)
                    return true;
            }
            cursor.clear();
            auto pag = j.find("pagination");
            if (pag != j.end() && pag->is_object()) cursor = str_field(*pag, "cursor");
        } catch (const nlohmann::json::exception& e) {
            log_error("twitch", std::string("Unexpected subscription listing: ") + e.what());
            return std::nullopt;
        }
        if (cursor.empty()) return false;
    }
    log_warn("twitch", "Gave up listing " + type + " subscriptions after " +
                       std::to_string(MAX_PAGES) + " pages");
    return false;
}

bool TwitchEventSub::ensure_subscriptions(const std::string& callback_url) {
    log_info("twitch", "Updating EventSub subscriptions for " + callback_url);
    bool all_ok = true;
    for (const auto& type : config_.eventsub_types) {
        auto request = subscription_request(type, callback_url);
        if (!request) {
            log_warn("twitch", "Don't know how to subscribe to " + type + ", skipping");
            all_ok = false;
            continue;
        }

        auto found = exists(type, callback_url);
        if (!found) {
            all_ok = false;
            continue;
        }
        if (*found) {
            log_debug("twitch", type + " is already subscribed");
            continue;
        }

        std::string base = config_.api_base;
        while (!base.empty() && base.back() == '/') base.pop_back();
        HttpResponse resp = http_.post(base + "/eventsub/subscriptions", request->dump(), headers());
        if (resp.status_code == 202) {
            log_info("twitch", "Subscribed to " + type);
        } else if (resp.status_code == 409) {
            // Created by someone else between the listing and now
            log_info("twitch", type + " was subscribed concurrently");
        } else {
            log_error("twitch", "Subscribing to " + type + " failed: " +
                                (resp.status_code == 0 ? resp.error
                                                       : "HTTP " + std::to_string(resp.status_code) +
                                                         ": " + resp.body));
            all_ok = false;
        }
    }
    return all_ok;
}

} // namespace rconbridge
