#include "EventStore.h"
#include "LoggerMacros.h"

namespace SettleFS {

EventStore::EventStore(Duration timeout) : timeout_(timeout) {}

void EventStore::addEvent(const WatchEvent& event, Clock::time_point now) {
    stats_.eventsReceived++;

    for (const auto& path : event.paths) {
        auto it = paths_.find(path);
        if (it != paths_.end()) {
            it->second.update = now;
            stats_.eventsCoalesced++;
        } else {
            paths_.emplace(path, PathTimingState{now, now});
            LOG_DEBUG_COMP_IF("Caching " + path, "EventStore");
        }
    }
}

void EventStore::addError(Error error) {
    errors_.push_back(std::move(error));
}

std::vector<DebouncedEvent> EventStore::debouncedEvents(Clock::time_point now) {
    std::vector<DebouncedEvent> expired;
    expired.reserve(paths_.size());

    for (auto it = paths_.begin(); it != paths_.end();) {
        auto updateElapsed = now - it->second.update;
        auto insertElapsed = now - it->second.insert;

        if (updateElapsed >= timeout_) {
            expired.emplace_back(it->first, DebouncedEventKind::Any);
            stats_.anyEmitted++;
            it = paths_.erase(it);
        } else if (insertElapsed >= timeout_) {
            expired.emplace_back(it->first, DebouncedEventKind::AnyContinuous);
            stats_.continuousEmitted++;
            ++it;
        } else {
            ++it;
        }
    }

    return expired;
}

std::vector<Error> EventStore::errors() {
    std::vector<Error> drained;
    drained.swap(errors_);
    stats_.errorsForwarded += drained.size();
    return drained;
}

} // namespace SettleFS
