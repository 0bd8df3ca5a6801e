#include "Debouncer.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"
#include <iterator>
#include <system_error>

namespace SettleFS {

namespace {

const char* COMPONENT = "Debouncer";

std::string toMillisString(Duration d) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(d).count()) + "ms";
}

} // namespace

/**
 * State shared between the handle, the watcher callback and the ticker.
 * Reference counted so a detached ticker never outlives it.
 */
struct Debouncer::SharedState {
    SharedState(Duration timeout, Duration tickInterval, std::shared_ptr<IEventSink> eventSink)
        : store(timeout), tick(tickInterval), sink(std::move(eventSink)),
          exitedFuture(exited.get_future().share()) {}

    void onRawEvent(const Result<WatchEvent>& raw);
    void deferError(Error error);
    std::vector<Error> takeDeferred();
    void requestStop();
    bool waitTick();
    void dispatch(std::vector<DebouncedEvent> events, std::vector<Error> errors);

    // Guards store
    std::mutex mutex;
    EventStore store;

    // Failures raised while the cache lock could not be used
    std::mutex deferredMutex;
    std::vector<Error> deferredErrors;

    std::mutex stopMutex;
    std::condition_variable stopCv;
    std::atomic<bool> stop{false};

    const Duration tick;
    std::shared_ptr<IEventSink> sink;

    std::promise<void> exited;
    std::shared_future<void> exitedFuture;
};

void Debouncer::SharedState::onRawEvent(const Result<WatchEvent>& raw) {
    try {
        std::lock_guard<std::mutex> lock(mutex);
        if (raw.isOk()) {
            store.addEvent(raw.value());
        } else {
            store.addError(raw.error());
        }
    } catch (const std::exception& e) {
        deferError(Core::ErrorRegistry::makeError(Core::ErrorCode::LOCK_FAILURE,
            std::string("raw event dropped: ") + e.what(), COMPONENT));
    }
}

void Debouncer::SharedState::deferError(Error error) {
    LOG_ERROR_COMP(error.message, COMPONENT);
    try {
        std::lock_guard<std::mutex> lock(deferredMutex);
        deferredErrors.push_back(std::move(error));
    } catch (const std::exception& e) {
        LOG_CRITICAL_COMP(std::string("Failed to queue debouncer error: ") + e.what(), COMPONENT);
    }
}

std::vector<Error> Debouncer::SharedState::takeDeferred() {
    std::vector<Error> drained;
    std::lock_guard<std::mutex> lock(deferredMutex);
    drained.swap(deferredErrors);
    return drained;
}

void Debouncer::SharedState::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex);
        stop.store(true, std::memory_order_release);
    }
    stopCv.notify_all();
}

// Sleeps one tick. Returns false when a stop was requested meanwhile.
bool Debouncer::SharedState::waitTick() {
    std::unique_lock<std::mutex> lock(stopMutex);
    return !stopCv.wait_for(lock, tick, [this]() {
        return stop.load(std::memory_order_acquire);
    });
}

void Debouncer::SharedState::dispatch(std::vector<DebouncedEvent> events, std::vector<Error> errors) {
    if (!events.empty()) {
        LOG_DEBUG_COMP_IF("Dispatching " + std::to_string(events.size()) + " debounced event(s)", COMPONENT);
        try {
            sink->handleEvent(DebounceResult(std::move(events)));
        } catch (const std::exception& e) {
            LOG_ERROR_COMP(std::string("Event handler threw: ") + e.what(), COMPONENT);
        } catch (...) {
            LOG_ERROR_COMP("Event handler threw an unknown exception", COMPONENT);
        }
    }

    if (!errors.empty()) {
        LOG_WARN_COMP("Forwarding " + std::to_string(errors.size()) + " watcher error(s)", COMPONENT);
        try {
            sink->handleEvent(DebounceResult(std::move(errors)));
        } catch (const std::exception& e) {
            LOG_ERROR_COMP(std::string("Error handler threw: ") + e.what(), COMPONENT);
        } catch (...) {
            LOG_ERROR_COMP("Error handler threw an unknown exception", COMPONENT);
        }
    }
}

Debouncer::Debouncer(std::shared_ptr<SharedState> state, std::unique_ptr<IWatcher> watcher,
                     std::thread thread, Duration timeout, Duration tickInterval)
    : state_(std::move(state)),
      watcher_(std::move(watcher)),
      thread_(std::move(thread)),
      tickerId_(thread_.get_id()),
      timeout_(timeout),
      tickInterval_(tickInterval) {}

Debouncer::~Debouncer() {
    // Deliberately no join; see stop()
    state_->requestStop();
    if (thread_.joinable()) {
        thread_.detach();
    }
}

void Debouncer::stop() {
    state_->requestStop();

    if (std::this_thread::get_id() == tickerId_) {
        // Called from inside a handler; the loop exits once it returns
        if (thread_.joinable()) {
            thread_.detach();
        }
    } else {
        if (thread_.joinable()) {
            thread_.join();
        } else {
            state_->exitedFuture.wait();
        }
        Logger::instance().info("Debouncer stopped", COMPONENT);
    }
    watcher_->shutdown();
}

void Debouncer::stopNonBlocking() {
    state_->requestStop();
    if (thread_.joinable()) {
        thread_.detach();
    }
}

bool Debouncer::isStopped() const {
    return state_->exitedFuture.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::shared_future<void> Debouncer::stopped() const {
    return state_->exitedFuture;
}

EventStore::Stats Debouncer::getStats() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->store.getStats();
}

void Debouncer::tickLoop(std::shared_ptr<SharedState> state) {
    try {
        while (!state->stop.load(std::memory_order_acquire)) {
            if (!state->waitTick()) {
                break;
            }

            std::vector<DebouncedEvent> events;
            std::vector<Error> errors;
            try {
                std::lock_guard<std::mutex> lock(state->mutex);
                events = state->store.debouncedEvents();
                errors = state->store.errors();
            } catch (const std::exception& e) {
                errors.push_back(Core::ErrorRegistry::makeError(Core::ErrorCode::LOCK_FAILURE,
                    std::string("drain failed: ") + e.what(), COMPONENT));
                LOG_ERROR_COMP(errors.back().message, COMPONENT);
            }

            auto deferred = state->takeDeferred();
            errors.insert(errors.end(),
                          std::make_move_iterator(deferred.begin()),
                          std::make_move_iterator(deferred.end()));

            state->dispatch(std::move(events), std::move(errors));
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL_COMP(std::string("Debouncer loop terminated: ") + e.what(), COMPONENT);
    } catch (...) {
        LOG_CRITICAL_COMP("Debouncer loop terminated by an unknown exception", COMPONENT);
    }

    LOG_DEBUG_COMP_IF("Debouncer loop exited", COMPONENT);
    state->exited.set_value();
}

Result<std::unique_ptr<Debouncer>> makeDebouncer(const DebounceSettings& settings,
                                                 std::shared_ptr<IEventSink> sink,
                                                 std::unique_ptr<IWatcher> watcher) {
    using Core::ErrorCode;
    using Core::ErrorRegistry;

    auto tick = settings.resolveTick();
    if (!tick) {
        LOG_ERROR_COMP(tick.error().toString(), COMPONENT);
        return tick.error();
    }
    if (!sink) {
        return ErrorRegistry::makeError(ErrorCode::INVALID_CONFIGURATION, "event sink is null", COMPONENT);
    }
    if (!watcher) {
        return ErrorRegistry::makeError(ErrorCode::INVALID_CONFIGURATION, "watcher is null", COMPONENT);
    }

    auto state = std::make_shared<Debouncer::SharedState>(settings.timeout, tick.value(), std::move(sink));

    auto init = watcher->initialize([state](const Result<WatchEvent>& raw) {
        state->onRawEvent(raw);
    });
    if (!init) {
        LOG_ERROR_COMP("Watcher " + watcher->getName() + " failed: " + init.error().toString(), COMPONENT);
        return init.error();
    }

    std::thread thread;
    try {
        thread = std::thread(&Debouncer::tickLoop, state);
    } catch (const std::system_error& e) {
        watcher->shutdown();
        return ErrorRegistry::makeError(ErrorCode::INTERNAL_ERROR,
            std::string("failed to start debouncer thread: ") + e.what(), COMPONENT);
    }

    Logger::instance().info("Debouncer started on " + watcher->getName() + " with " +
                            toMillisString(settings.timeout) + " timeout, " +
                            toMillisString(tick.value()) + " tick", COMPONENT);

    return std::unique_ptr<Debouncer>(new Debouncer(std::move(state), std::move(watcher),
                                                    std::move(thread), settings.timeout, tick.value()));
}

Result<std::unique_ptr<Debouncer>> makeDebouncer(const DebounceSettings& settings,
                                                 CallbackSink::Handler handler,
                                                 std::unique_ptr<IWatcher> watcher) {
    if (!handler) {
        return Core::ErrorRegistry::makeError(Core::ErrorCode::INVALID_CONFIGURATION,
                                              "event handler is empty", COMPONENT);
    }
    return makeDebouncer(settings, std::make_shared<CallbackSink>(std::move(handler)), std::move(watcher));
}

} // namespace SettleFS
