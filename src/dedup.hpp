#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rconbridge {

// Recently seen delivery fingerprints. Entries older than the retention
// window are evicted lazily; when the size cap is reached the oldest entries
// go first. In-memory only: a restart forgets everything.
class EventDeduplicator {
public:
    using Clock = std::chrono::steady_clock;

    EventDeduplicator(uint32_t retention_seconds, uint32_t max_entries);

    // True if the fingerprint was not seen within the window; it is recorded
    // in the same critical section, so of two concurrent callers with the
    // same fingerprint exactly one gets true.
    bool check_and_insert(const std::string& fingerprint);
    bool check_and_insert(const std::string& fingerprint, Clock::time_point now);

    // Drop a fingerprint, e.g. when the event could not be enqueued and the
    // transport should be allowed to redeliver it.
    bool forget(const std::string& fingerprint);

    size_t size() const;
    void clear();

private:
    void evict(Clock::time_point now);
    bool live(const std::pair<Clock::time_point, std::string>& entry) const;

    std::chrono::seconds retention_;
    uint32_t max_entries_;
    std::unordered_map<std::string, Clock::time_point> seen_;
    // Insertion order. Entries whose time no longer matches seen_ (forgotten
    // or refreshed) are stale and skipped.
    std::deque<std::pair<Clock::time_point, std::string>> order_;
    mutable std::mutex mutex_;
};

} // namespace rconbridge
