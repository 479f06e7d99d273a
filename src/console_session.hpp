#pragma once
#include "bounded_queue.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "model.hpp"
#include "rcon.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace rconbridge {

// Owns the single console connection. Callers hand commands to submit();
// a worker thread connects, authenticates and runs them one at a time in
// FIFO order. Nothing outside the worker touches the connection.
//
//   Disconnected -> Connecting -> Authenticating -> Ready -> Disconnected
//                                      \-> AuthRejected (until request_reconnect)
class ConsoleSession {
public:
    // Opens a fresh, unauthenticated connection. Throws RconError on failure.
    using Connector = std::function<std::unique_ptr<RconConnection>()>;

    ConsoleSession(const ConsoleConfig& config, Connector connector, EventBus* bus = nullptr);
    ~ConsoleSession();

    ConsoleSession(const ConsoleSession&) = delete;
    ConsoleSession& operator=(const ConsoleSession&) = delete;

    // Real TCP connector for config.address.
    static Connector tcp_connector(const ConsoleConfig& config);

    // A stopped session cannot be started again.
    void start();

    // Finish (or time out) the in-flight command, close the connection and
    // report what was still queued. Idempotent.
    void stop();

    // Relayed when queued. QueueFull drops this (newest) command;
    // ConsoleAuthRejected and ConsoleUnavailable (stopped) reject it.
    RelayOutcome submit(ConsoleCommand command);

    // Force a connection attempt now; clears AuthRejected.
    void request_reconnect();

    ConsoleState state() const;

    // Block until the state equals want or the timeout passes.
    bool wait_for_state(ConsoleState want, std::chrono::milliseconds timeout) const;

    size_t queued() const { return queue_.size(); }
    uint64_t executed() const { return executed_.load(); }
    uint64_t retried() const { return retried_.load(); }
    uint64_t dropped_unacknowledged() const { return dropped_unacked_.load(); }
    uint64_t connect_attempts() const { return connect_attempts_.load(); }

private:
    void run();
    bool ensure_connected();
    void run_command(ConsoleCommand command);
    void set_state(ConsoleState next, const std::string& detail = "");
    // Sleep up to d; returns early on stop or reconnect request.
    void interruptible_wait(std::chrono::milliseconds d);

    ConsoleConfig config_;
    Connector connector_;
    EventBus* bus_;

    BoundedQueue<ConsoleCommand> queue_;
    std::optional<ConsoleCommand> head_;   // worker-only; runs before the queue
    std::unique_ptr<RconConnection> conn_; // worker-only
    std::chrono::milliseconds backoff_;    // worker-only

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    ConsoleState state_ = ConsoleState::Disconnected;
    bool reconnect_requested_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> retried_{0};
    std::atomic<uint64_t> dropped_unacked_{0};
    std::atomic<uint64_t> connect_attempts_{0};
    std::thread thread_;
};

} // namespace rconbridge
