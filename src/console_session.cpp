#include "console_session.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>

namespace rconbridge {

static constexpr std::chrono::milliseconds IDLE_POLL{200};

ConsoleSession::ConsoleSession(const ConsoleConfig& config, Connector connector, EventBus* bus)
    : config_(config)
    , connector_(std::move(connector))
    , bus_(bus)
    , queue_(config.queue_capacity)
    , backoff_(config.initial_backoff_ms)
{}

ConsoleSession::~ConsoleSession() {
    stop();
}

ConsoleSession::Connector ConsoleSession::tcp_connector(const ConsoleConfig& config) {
    std::string address = config.address;
    uint32_t timeout_ms = config.command_timeout_ms;
    return [address, timeout_ms]() -> std::unique_ptr<RconConnection> {
        return TcpRconConnection::connect(address, timeout_ms);
    };
}

void ConsoleSession::start() {
    if (stopped_.load() || running_.exchange(true)) return;
    thread_ = std::thread([this]() { run(); });
}

void ConsoleSession::stop() {
    if (!running_.exchange(false)) return;
    stopped_.store(true);
    queue_.close();
    { std::lock_guard<std::mutex> lock(state_mutex_); }
    state_cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    size_t left = queue_.size() + (head_ ? 1 : 0);
    if (left > 0) {
        log_warn("console", std::to_string(left) + " queued command(s) not submitted at shutdown");
    }
    conn_.reset();
    set_state(ConsoleState::Disconnected, "stopped");
}

RelayOutcome ConsoleSession::submit(ConsoleCommand command) {
    if (stopped_.load()) return RelayOutcome::ConsoleUnavailable;
    if (state() == ConsoleState::AuthRejected) return RelayOutcome::ConsoleAuthRejected;

    std::string text = command.text;
    if (!queue_.try_push(std::move(command))) {
        if (queue_.closed()) return RelayOutcome::ConsoleUnavailable;
        log_warn("console", "Command queue full (" + std::to_string(queue_.capacity()) +
                            "), dropping: " + text);
        return RelayOutcome::QueueFull;
    }
    return RelayOutcome::Relayed;
}

void ConsoleSession::request_reconnect() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        reconnect_requested_ = true;
    }
    state_cv_.notify_all();
}

ConsoleState ConsoleSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ConsoleSession::wait_for_state(ConsoleState want, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return state_ == want; });
}

void ConsoleSession::set_state(ConsoleState next, const std::string& detail) {
    ConsoleStateChangedEvent ev;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == next) return;
        ev.previous = state_;
        state_ = next;
    }
    state_cv_.notify_all();
    ev.current = next;
    ev.detail = detail;
    log_debug("console", std::string(console_state_name(ev.previous)) + " -> " +
                         console_state_name(next) + (detail.empty() ? "" : ": " + detail));
    publish_if(bus_, ev);
}

void ConsoleSession::interruptible_wait(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, d, [this] { return !running_.load() || reconnect_requested_; });
}

bool ConsoleSession::ensure_connected() {
    if (conn_) return true;

    if (state() == ConsoleState::AuthRejected) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this] { return !running_.load() || reconnect_requested_; });
        if (!running_.load()) return false;
        lock.unlock();
        log_info("console", "Reconnect requested after auth rejection");
        set_state(ConsoleState::Disconnected, "reconnect requested");
    }

    bool forced;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        forced = reconnect_requested_;
        reconnect_requested_ = false;
    }
    // Connect lazily: only when there is work or an operator asked for it
    if (!forced && !head_) {
        head_ = queue_.pop_for(IDLE_POLL);
        if (!head_) return false;
    }

    connect_attempts_++;
    set_state(ConsoleState::Connecting, config_.address);
    try {
        auto conn = connector_();
        if (!conn) throw RconError("connector returned no connection");
        set_state(ConsoleState::Authenticating);
        conn->authenticate(config_.password);
        conn_ = std::move(conn);
        backoff_ = std::chrono::milliseconds(config_.initial_backoff_ms);
        log_info("console", "Connected to " + config_.address);
        set_state(ConsoleState::Ready);
        return true;
    } catch (const RconAuthError& e) {
        log_error("console", std::string("Authentication rejected by ") + config_.address +
                             ": " + e.what() + ". Commands are refused until a reconnect is requested");
        set_state(ConsoleState::AuthRejected, e.what());
        return false;
    } catch (const std::exception& e) {
        log_warn("console", std::string("Connect failed: ") + e.what() + ", retrying in " +
                            std::to_string(backoff_.count()) + "ms");
        set_state(ConsoleState::Disconnected, e.what());
        interruptible_wait(backoff_);
        backoff_ = std::min(backoff_ * 2, std::chrono::milliseconds(config_.max_backoff_ms));
        return false;
    }
}

void ConsoleSession::run_command(ConsoleCommand command) {
    try {
        std::string response = conn_->execute(command.text);
        executed_++;
        log_debug("console", "> " + command.text + (response.empty() ? "" : " < " + response));
        CommandSubmittedEvent ev;
        ev.command = command.text;
        ev.fingerprint = command.fingerprint;
        ev.response = response;
        publish_if(bus_, ev);
    } catch (const RconError& e) {
        conn_.reset();
        set_state(ConsoleState::Disconnected, e.what());
        if (!e.sent()) {
            // Never reached the server: safe to run after reconnecting
            retried_++;
            head_ = std::move(command);
            log_warn("console", std::string("Send failed, will retry after reconnect: ") + e.what());
            return;
        }
        dropped_unacked_++;
        log_warn("console", "Response lost, not retrying '" + command.text + "': " + e.what());
        EventDroppedEvent ev;
        ev.pipeline = "console";
        ev.fingerprint = command.fingerprint;
        ev.outcome = RelayOutcome::DeliveryFailed;
        ev.detail = e.what();
        publish_if(bus_, ev);
    } catch (const std::invalid_argument& e) {
        log_warn("console", std::string("Rejected command: ") + e.what());
        EventDroppedEvent ev;
        ev.pipeline = "console";
        ev.fingerprint = command.fingerprint;
        ev.outcome = RelayOutcome::Malformed;
        ev.detail = e.what();
        publish_if(bus_, ev);
    } catch (const std::exception& e) {
        conn_.reset();
        set_state(ConsoleState::Disconnected, e.what());
        dropped_unacked_++;
        log_error("console", "Command '" + command.text + "' failed: " + e.what());
    }
}

void ConsoleSession::run() {
    while (running_.load()) {
        if (!ensure_connected()) continue;

        std::optional<ConsoleCommand> next;
        if (head_) {
            next = std::move(head_);
            head_.reset();
        } else {
            next = queue_.pop_for(IDLE_POLL);
        }
        if (!next) continue;
        run_command(std::move(*next));
    }
}

} // namespace rconbridge
