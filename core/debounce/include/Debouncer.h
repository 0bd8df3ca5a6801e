#pragma once

/**
 * @file Debouncer.h
 * @brief Rate-limits raw watcher events into debounced batches
 *
 * Raw events from an IWatcher are folded into an EventStore under one
 * lock. A ticker thread wakes every tick interval, drains whatever is ready
 * and hands it to the IEventSink outside the lock.
 */

#include "DebounceSettings.h"
#include "EventSink.h"
#include "EventStore.h"
#include "IWatcher.h"
#include "Result.h"
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace SettleFS {

class Debouncer;

/**
 * @brief Build a running Debouncer over the given watcher
 *
 * Fails without starting anything when the settings are invalid, the sink
 * or watcher is null, or the watcher cannot be initialized.
 */
Result<std::unique_ptr<Debouncer>> makeDebouncer(const DebounceSettings& settings,
                                                 std::shared_ptr<IEventSink> sink,
                                                 std::unique_ptr<IWatcher> watcher);

Result<std::unique_ptr<Debouncer>> makeDebouncer(const DebounceSettings& settings,
                                                 CallbackSink::Handler handler,
                                                 std::unique_ptr<IWatcher> watcher);

/**
 * @brief Owner of the watcher and the ticker thread
 *
 * Destroying a Debouncer only requests a stop; the ticker thread is
 * detached and exits on its own within one tick. Call stop() when the
 * caller needs the guarantee that no handler runs afterwards, or wait on
 * stopped().
 *
 * A detached ticker still logs through Logger::instance(), so callers must
 * stop() or wait on stopped() before returning from main.
 */
class Debouncer {
public:
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    /**
     * @brief Stop and wait for the ticker thread to exit
     *
     * May block for one tick plus one handler call. Also shuts the watcher
     * down. Safe to call more than once.
     */
    void stop();

    /**
     * @brief Request a stop without waiting
     *
     * At most one more handler call may still happen.
     */
    void stopNonBlocking();

    bool isStopped() const;

    /**
     * @brief Ready once the ticker thread has exited
     */
    std::shared_future<void> stopped() const;

    /**
     * @brief The backend, for adding and removing watched paths
     */
    IWatcher& watcher() { return *watcher_; }

    Duration timeout() const { return timeout_; }
    Duration tickInterval() const { return tickInterval_; }

    EventStore::Stats getStats() const;

private:
    struct SharedState;

    Debouncer(std::shared_ptr<SharedState> state, std::unique_ptr<IWatcher> watcher,
              std::thread thread, Duration timeout, Duration tickInterval);

    static void tickLoop(std::shared_ptr<SharedState> state);

    friend Result<std::unique_ptr<Debouncer>> makeDebouncer(const DebounceSettings& settings,
                                                            std::shared_ptr<IEventSink> sink,
                                                            std::unique_ptr<IWatcher> watcher);

    std::shared_ptr<SharedState> state_;
    std::unique_ptr<IWatcher> watcher_;
    std::thread thread_;
    std::thread::id tickerId_;
    Duration timeout_;
    Duration tickInterval_;
};

} // namespace SettleFS
