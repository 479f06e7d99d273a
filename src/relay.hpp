#pragma once
#include "bounded_queue.hpp"
#include "chat_sink.hpp"
#include "command_translator.hpp"
#include "config.hpp"
#include "console_session.hpp"
#include "dedup.hpp"
#include "event_bus.hpp"
#include "identity_store.hpp"
#include "log_tailer.hpp"
#include "model.hpp"
#include "outbound_translator.hpp"
#include "signature.hpp"
#include "webhook_server.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <regex>
#include <thread>
#include <vector>

namespace rconbridge {

// Wires the two pipelines:
//   inbound:  webhook -> verify -> dedup -> parse -> queue -> worker:
//             echo check -> resolve -> translate -> filter -> console
//   outbound: tailer -> parse -> resolve -> translate -> filter -> chat
// A failure inside one event is logged and counted; the pipeline goes on.
class RelayOrchestrator {
public:
    RelayOrchestrator(const Config& config,
                      IdentityLinkStore& identities,
                      ConsoleSession& console,
                      ChatSink& chat,
                      LogTailer& tailer,
                      EventBus* bus = nullptr);
    ~RelayOrchestrator();

    RelayOrchestrator(const RelayOrchestrator&) = delete;
    RelayOrchestrator& operator=(const RelayOrchestrator&) = delete;

    // WebhookServer handler. Answers quickly; the event itself is handled
    // on the inbound worker.
    WebhookResponse handle_webhook(const WebhookRequest& request);

    // One inbound event, synchronously (the worker calls this).
    RelayOutcome process_inbound(const InboundEvent& event);

    // Process every queued inbound event on the calling thread.
    size_t drain_inbound();

    // One log line, synchronously (the tail loop calls this). Returns the
    // outcome of the last payload when a line produced several.
    RelayOutcome process_log_event(const LogEvent& event);

    // Start the inbound worker and the tail loop.
    void start();

    // Drain queued inbound events, stop the tail loop, save the checkpoint.
    void stop();

    uint64_t count(RelayOutcome outcome) const;
    size_t inbound_queued() const { return inbound_.size(); }

private:
    void inbound_loop();
    void tail_loop();
    RelayOutcome record(RelayOutcome outcome, const char* pipeline,
                        const std::string& fingerprint, const std::string& detail);
    bool excluded(const std::string& text) const;

    const Config& config_;
    IdentityLinkStore& identities_;
    ConsoleSession& console_;
    ChatSink& chat_;
    LogTailer& tailer_;
    EventBus* bus_;

    SignatureVerifier verifier_;
    EventDeduplicator dedup_;
    CommandTranslator commands_;
    OutboundTranslator outbound_;
    std::vector<std::regex> filters_;

    BoundedQueue<InboundEvent> inbound_;

    static constexpr size_t OUTCOME_COUNT = static_cast<size_t>(RelayOutcome::DeliveryFailed) + 1;
    std::array<std::atomic<uint64_t>, OUTCOME_COUNT> counts_{};

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread inbound_thread_;
    std::thread tail_thread_;
};

} // namespace rconbridge
