#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace rconbridge {

using EventHandler = std::function<void(const Event&)>;

// In-process fan-out of relay status events. Publishers are the pipeline
// threads (console worker, inbound worker, tail loop), so handlers run on
// whichever thread published and must be thread-safe themselves.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Deliver synchronously, in registration order, outside the lock.
    // A handler that throws is logged and skipped; later handlers still run.
    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish when a bus is attached; components hold an optional EventBus*.
inline void publish_if(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace rconbridge
