#pragma once

/**
 * @file IWatcher.h
 * @brief Abstract raw filesystem watcher consumed by the debouncer
 */

#include "Result.h"
#include <string>
#include <vector>
#include <functional>

namespace SettleFS {

/**
 * @brief Backend-specific change kinds
 *
 * Reported for diagnostics only. The debouncer collapses all of them into
 * a single "changed" signal.
 */
enum class WatchEventType {
    Create,
    Modify,
    Delete,
    Rename,
    AttribChange,
    Other
};

/**
 * @brief One raw notification from a backend
 *
 * A single notification may name several paths (a rename names both the
 * old and the new path).
 */
struct WatchEvent {
    WatchEventType type{WatchEventType::Other};
    std::vector<std::string> paths;
    bool isDirectory{false};
};

/**
 * @brief Raw callback: either an event or a backend error
 *
 * Invoked on a backend-owned thread.
 */
using WatchCallback = std::function<void(const Result<WatchEvent>&)>;

/**
 * @brief Abstract watcher interface
 */
class IWatcher {
public:
    virtual ~IWatcher() = default;

    /**
     * @brief Register the callback and start delivering events
     */
    virtual VoidResult initialize(WatchCallback callback) = 0;

    /**
     * @brief Stop delivering events and release backend resources
     */
    virtual void shutdown() = 0;

    virtual VoidResult addWatch(const std::string& path) = 0;
    virtual VoidResult removeWatch(const std::string& path) = 0;

    /**
     * @brief Watch path and every directory below it
     */
    virtual VoidResult addWatchRecursive(const std::string& path) = 0;

    virtual bool isWatching(const std::string& path) const = 0;
    virtual size_t getWatchCount() const = 0;
    virtual std::string getName() const = 0;
};

} // namespace SettleFS
