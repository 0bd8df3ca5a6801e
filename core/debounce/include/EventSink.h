#pragma once

/**
 * @file EventSink.h
 * @brief Consumers of debounced batches
 */

#include "DebouncedEvent.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace SettleFS {

/**
 * @brief Receives debounced batches on the debouncer's ticker thread
 *
 * Called at most twice per tick: once with events, once with errors.
 * A slow handler delays the next tick, never the watcher callback.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void handleEvent(const DebounceResult& result) = 0;
};

/**
 * @brief Adapts a plain function into a sink
 */
class CallbackSink : public IEventSink {
public:
    using Handler = std::function<void(const DebounceResult&)>;

    explicit CallbackSink(Handler handler) : handler_(std::move(handler)) {}

    void handleEvent(const DebounceResult& result) override {
        if (handler_) {
            handler_(result);
        }
    }

private:
    Handler handler_;
};

/**
 * @brief Unbounded multi-producer queue of batches
 *
 * Hand it to the debouncer and read batches from any other thread.
 * After close() new batches are dropped and blocked readers wake up.
 */
class ChannelSink : public IEventSink {
public:
    ChannelSink() = default;
    ChannelSink(const ChannelSink&) = delete;
    ChannelSink& operator=(const ChannelSink&) = delete;

    void handleEvent(const DebounceResult& result) override;

    /**
     * @brief Block until a batch arrives or the channel is closed
     * @return std::nullopt once closed and drained
     */
    std::optional<DebounceResult> receive();

    std::optional<DebounceResult> receiveFor(std::chrono::milliseconds timeout);
    std::optional<DebounceResult> tryReceive();

    void close();
    bool isClosed() const;
    size_t size() const;

private:
    std::optional<DebounceResult> popLocked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DebounceResult> queue_;
    bool closed_{false};
};

} // namespace SettleFS
