#include "dedup.hpp"

#include <algorithm>

namespace rconbridge {

EventDeduplicator::EventDeduplicator(uint32_t retention_seconds, uint32_t max_entries)
    : retention_(retention_seconds), max_entries_(std::max<uint32_t>(max_entries, 1)) {}

bool EventDeduplicator::check_and_insert(const std::string& fingerprint) {
    return check_and_insert(fingerprint, Clock::now());
}

bool EventDeduplicator::check_and_insert(const std::string& fingerprint,
                                         Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = seen_.find(fingerprint);
    if (it != seen_.end()) {
        if (now - it->second <= retention_) return false;
        // Expired: a genuinely new delivery with a recycled fingerprint
        it->second = now;
        order_.emplace_back(now, fingerprint);
        evict(now);
        return true;
    }

    seen_.emplace(fingerprint, now);
    order_.emplace_back(now, fingerprint);
    evict(now);
    return true;
}

bool EventDeduplicator::forget(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.erase(fingerprint) > 0;
}

bool EventDeduplicator::live(const std::pair<Clock::time_point, std::string>& entry) const {
    auto it = seen_.find(entry.second);
    return it != seen_.end() && it->second == entry.first;
}

void EventDeduplicator::evict(Clock::time_point now) {
    // Must be called with mutex_ already held.

    while (!order_.empty()) {
        const auto& front = order_.front();
        if (!live(front)) {
            order_.pop_front();
        } else if (now - front.first > retention_) {
            seen_.erase(front.second);
            order_.pop_front();
        } else {
            break;
        }
    }

    while (seen_.size() > max_entries_ && !order_.empty()) {
        if (live(order_.front())) seen_.erase(order_.front().second);
        order_.pop_front();
    }

    // Stale entries behind a live front are only reclaimed when it leaves;
    // rebuild once they outnumber the live ones.
    if (order_.size() > 2 * seen_.size() + 64) {
        std::deque<std::pair<Clock::time_point, std::string>> kept;
        for (auto& entry : order_) {
            if (live(entry)) kept.push_back(std::move(entry));
        }
        order_.swap(kept);
    }
}

size_t EventDeduplicator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

void EventDeduplicator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.clear();
    order_.clear();
}

} // namespace rconbridge
