#include "relay.hpp"
#include "log.hpp"
#include "platforms/twitch.hpp"
#include "util.hpp"

#include <exception>

namespace rconbridge {

static constexpr std::chrono::milliseconds INBOUND_POLL{200};

RelayOrchestrator::RelayOrchestrator(const Config& config,
                                     IdentityLinkStore& identities,
                                     ConsoleSession& console,
                                     ChatSink& chat,
                                     LogTailer& tailer,
                                     EventBus* bus)
    : config_(config)
    , identities_(identities)
    , console_(console)
    , chat_(chat)
    , tailer_(tailer)
    , bus_(bus)
    , verifier_(config.twitch.eventsub_secret, config.twitch.timestamp_tolerance)
    , dedup_(config.dedup.retention_seconds, config.dedup.max_entries)
    , commands_(config.commands, config.twitch.label())
    , outbound_(config.console.label(), config.twitch.insert_zws_into_names)
    , inbound_(config.webhook.inbound_queue_capacity)
{
    for (const auto& pattern : config.exclude_filters) {
        try {
            filters_.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            log_error("relay", "Ignoring invalid exclude filter '" + pattern + "': " + e.what());
        }
    }
}

RelayOrchestrator::~RelayOrchestrator() {
    stop();
}

uint64_t RelayOrchestrator::count(RelayOutcome outcome) const {
    return counts_[static_cast<size_t>(outcome)].load();
}

RelayOutcome RelayOrchestrator::record(RelayOutcome outcome, const char* pipeline,
                                       const std::string& fingerprint,
                                       const std::string& detail) {
    counts_[static_cast<size_t>(outcome)]++;
    if (outcome != RelayOutcome::Relayed) {
        EventDroppedEvent ev;
        ev.pipeline = pipeline;
        ev.fingerprint = fingerprint;
        ev.outcome = outcome;
        ev.detail = detail;
        publish_if(bus_, ev);
    }
    return outcome;
}

bool RelayOrchestrator::excluded(const std::string& text) const {
    for (const auto& re : filters_) {
        if (std::regex_search(text, re)) return true;
    }
    return false;
}

// ── Inbound ──────────────────────────────────────────────────

static WebhookResponse respond(int status, std::string body) {
    WebhookResponse resp;
    resp.status = status;
    resp.body = std::move(body);
    return resp;
}

WebhookResponse RelayOrchestrator::handle_webhook(const WebhookRequest& request) {
    if (request.path != config_.webhook.path) return respond(404, "Not found");
    if (request.method != "POST") return respond(405, "Method not allowed");

    auto delivery = verifier_.verify(request.headers, request.body);
    if (!delivery) {
        log_warn("inbound", "Rejected delivery with a bad or stale signature");
        record(RelayOutcome::Unauthenticated, "inbound", "", "signature");
        return respond(401, "Invalid signature");
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& e) {
        log_warn("inbound", std::string("Unparseable body: ") + e.what());
        record(RelayOutcome::Malformed, "inbound", delivery->fingerprint, e.what());
        return respond(400, "Invalid JSON");
    }

    if (delivery->message_type == eventsub_message::Verification) {
        if (!body.contains("challenge") || !body["challenge"].is_string()) {
            record(RelayOutcome::Malformed, "inbound", delivery->fingerprint, "no challenge");
            return respond(400, "Missing challenge");
        }
        log_info("inbound", "Answering EventSub verification challenge");
        return respond(200, body["challenge"].get<std::string>());
    }

    if (delivery->message_type == eventsub_message::Revocation) {
        std::string type, status;
        if (body.contains("subscription") && body["subscription"].is_object()) {
            type = body["subscription"].value("type", "");
            status = body["subscription"].value("status", "");
        }
        log_warn("inbound", "Subscription " + type + " revoked: " + status);
        return respond(200, "");
    }

    if (delivery->message_type != eventsub_message::Notification) {
        log_debug("inbound", "Ignoring message type " + delivery->message_type);
        return respond(200, "");
    }

    if (!dedup_.check_and_insert(delivery->fingerprint)) {
        log_debug("inbound", "Duplicate delivery " + delivery->fingerprint);
        record(RelayOutcome::DuplicateEvent, "inbound", delivery->fingerprint, "");
        return respond(200, "");
    }

    auto event = parse_eventsub_notification(body, config_.twitch.platform);
    if (!event) {
        // Acknowledged anyway: redelivering the same body would not help
        log_warn("inbound", "Notification without subscription or event");
        record(RelayOutcome::Malformed, "inbound", delivery->fingerprint, "missing fields");
        return respond(200, "");
    }
    event->fingerprint = delivery->fingerprint;

    if (!inbound_.try_push(std::move(*event))) {
        dedup_.forget(delivery->fingerprint);
        log_warn("inbound", "Inbound queue full, asking for redelivery of " + delivery->fingerprint);
        record(RelayOutcome::QueueFull, "inbound", delivery->fingerprint, "inbound queue");
        return respond(503, "Busy");
    }
    return respond(200, "");
}

RelayOutcome RelayOrchestrator::process_inbound(const InboundEvent& event) {
    const std::string& fp = event.fingerprint;
    try {
        if (event.kind == EventKind::Chat && !event.message_id.empty() &&
            chat_.consume_own_message(event.message_id)) {
            return record(RelayOutcome::Echo, "inbound", fp, event.message_id);
        }

        // Only linked viewers reach the console, whatever the event kind
        std::optional<Identity> player = identities_.resolve(
            event.source_platform, event.source_user_id, config_.console.platform);
        if (!player) {
            log_info("inbound", std::string(event_kind_name(event.kind)) + " from " +
                                event.source_platform + ":" + event.source_user_id +
                                " has no linked player, dropping");
            return record(RelayOutcome::UnresolvedIdentity, "inbound", fp, event.source_user_id);
        }

        auto commands = commands_.translate(event, player);
        if (commands.empty()) {
            log_debug("inbound", "No commands for " + event.subscription_type);
            return record(RelayOutcome::TranslationNoop, "inbound", fp, event.subscription_type);
        }

        RelayOutcome result = RelayOutcome::Relayed;
        for (auto& cmd : commands) {
            if (event.kind == EventKind::Chat && excluded(cmd.text)) {
                result = record(RelayOutcome::Filtered, "inbound", fp, cmd.text);
                continue;
            }
            RelayOutcome outcome = console_.submit(cmd);
            if (outcome != RelayOutcome::Relayed) {
                log_warn("inbound", std::string("Console did not accept command: ") +
                                    outcome_name(outcome));
                result = outcome;
            }
            record(outcome, "inbound", fp, cmd.text);
        }
        return result;
    } catch (const std::exception& e) {
        log_error("inbound", "Event " + fp + " failed: " + e.what());
        return record(RelayOutcome::DeliveryFailed, "inbound", fp, e.what());
    }
}

size_t RelayOrchestrator::drain_inbound() {
    size_t n = 0;
    while (auto event = inbound_.try_pop()) {
        process_inbound(*event);
        ++n;
    }
    return n;
}

void RelayOrchestrator::inbound_loop() {
    for (;;) {
        auto event = inbound_.pop_for(INBOUND_POLL);
        if (!event) {
            if (inbound_.closed()) break;
            continue;
        }
        process_inbound(*event);
    }
}

// ── Outbound ─────────────────────────────────────────────────

RelayOutcome RelayOrchestrator::process_log_event(const LogEvent& event) {
    std::string where = "offset " + std::to_string(event.byte_offset);
    try {
        auto line = parse_log_line(event);
        if (!line) {
            if (trim(event.raw_line).empty()) return RelayOutcome::TranslationNoop;
            return record(RelayOutcome::Malformed, "outbound", where, event.raw_line);
        }
        if (line->kind == LogLineKind::Chat && line->actor == OutboundTranslator::SERVER_ACTOR) {
            return record(RelayOutcome::Filtered, "outbound", where, "server chat");
        }

        std::optional<Identity> sender;
        if (outbound_.requires_identity(*line)) {
            sender = identities_.resolve(config_.console.platform, line->actor,
                                         config_.twitch.platform);
            if (!sender) {
                log_info("outbound", line->actor + " has no linked " + config_.twitch.platform +
                                     " user, dropping chat");
                return record(RelayOutcome::UnresolvedIdentity, "outbound", where, line->actor);
            }
        }

        auto payloads = outbound_.translate(*line, sender);
        if (payloads.empty()) {
            log_debug("outbound", "Nothing to relay for: " + event.raw_line);
            return record(RelayOutcome::TranslationNoop, "outbound", where, line->tag);
        }

        RelayOutcome result = RelayOutcome::Relayed;
        for (const auto& payload : payloads) {
            if (excluded(payload.text)) {
                result = record(RelayOutcome::Filtered, "outbound", where, payload.text);
                continue;
            }
            if (!chat_.send(payload)) {
                result = record(RelayOutcome::DeliveryFailed, "outbound", where, payload.text);
                continue;
            }
            record(RelayOutcome::Relayed, "outbound", where, "");
            ChatDeliveredEvent ev;
            ev.text = payload.text;
            ev.sender_user_id = payload.sender_user_id.value_or("");
            publish_if(bus_, ev);
        }
        return result;
    } catch (const std::exception& e) {
        log_error("outbound", "Line at " + where + " failed: " + e.what());
        return record(RelayOutcome::DeliveryFailed, "outbound", where, e.what());
    }
}

void RelayOrchestrator::tail_loop() {
    auto interval = std::chrono::milliseconds(config_.tail.poll_interval_ms);
    while (running_.load()) {
        std::vector<LogEvent> events;
        try {
            events = tailer_.poll();
        } catch (const std::exception& e) {
            log_error("tailer", std::string("Poll failed: ") + e.what());
        }
        for (const auto& ev : events) process_log_event(ev);

        if (!events.empty()) continue;
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}

// ── Lifecycle ────────────────────────────────────────────────

void RelayOrchestrator::start() {
    if (running_.exchange(true)) return;
    inbound_thread_ = std::thread([this]() { inbound_loop(); });
    tail_thread_ = std::thread([this]() { tail_loop(); });
}

void RelayOrchestrator::stop() {
    if (!running_.exchange(false)) return;
    inbound_.close();
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (inbound_thread_.joinable()) inbound_thread_.join();
    if (tail_thread_.joinable()) tail_thread_.join();
    tailer_.save_checkpoint();
}

} // namespace rconbridge
