#include "EventSink.h"

namespace SettleFS {

void ChannelSink::handleEvent(const DebounceResult& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(result);
    }
    cv_.notify_one();
}

std::optional<DebounceResult> ChannelSink::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    return popLocked();
}

std::optional<DebounceResult> ChannelSink::receiveFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
    return popLocked();
}

std::optional<DebounceResult> ChannelSink::tryReceive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked();
}

void ChannelSink::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ChannelSink::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ChannelSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::optional<DebounceResult> ChannelSink::popLocked() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    DebounceResult front = std::move(queue_.front());
    queue_.pop_front();
    return front;
}

} // namespace SettleFS
