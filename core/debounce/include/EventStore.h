#pragma once

/**
 * @file EventStore.h
 * @brief Per-path dedup cache and timeout decisions for the debouncer
 *
 * Pure data plus decision logic. Not thread-safe: the Debouncer guards
 * every call with its own lock.
 */

#include "DebouncedEvent.h"
#include "IWatcher.h"
#include "Result.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace SettleFS {

using Clock = std::chrono::steady_clock;
using Duration = Clock::duration;

/**
 * @brief Timing state of one cached path
 */
struct PathTimingState {
    Clock::time_point insert;  // First event since the last Any emission
    Clock::time_point update;  // Most recent event
};

class EventStore {
public:
    struct Stats {
        uint64_t eventsReceived{0};
        uint64_t eventsCoalesced{0};
        uint64_t anyEmitted{0};
        uint64_t continuousEmitted{0};
        uint64_t errorsForwarded{0};
    };

    explicit EventStore(Duration timeout);

    /**
     * @brief Insert or refresh every path named by a raw event
     */
    void addEvent(const WatchEvent& event, Clock::time_point now = Clock::now());

    void addError(Error error);

    /**
     * @brief Evaluate every cached path against the timeout
     *
     * Quiet paths (no event for >= timeout) are emitted as Any and removed.
     * Paths cached for >= timeout that are still active are emitted as
     * AnyContinuous and kept with both timestamps unchanged. Everything
     * else stays silently. Order across paths is unspecified.
     */
    std::vector<DebouncedEvent> debouncedEvents(Clock::time_point now = Clock::now());

    /**
     * @brief Take all buffered errors, leaving the queue empty
     */
    std::vector<Error> errors();

    Duration timeout() const { return timeout_; }
    size_t size() const { return paths_.size(); }
    bool contains(const std::string& path) const { return paths_.count(path) > 0; }
    size_t pendingErrors() const { return errors_.size(); }
    Stats getStats() const { return stats_; }

private:
    std::unordered_map<std::string, PathTimingState> paths_;
    Duration timeout_;
    std::vector<Error> errors_;
    Stats stats_;
};

} // namespace SettleFS
