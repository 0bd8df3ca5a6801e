#pragma once

/**
 * @file InotifyWatcher.h
 * @brief inotify-based filesystem watcher
 */

#include "IWatcher.h"
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <optional>

namespace SettleFS {
namespace Watch {

class InotifyWatcher : public IWatcher {
public:
    InotifyWatcher();
    ~InotifyWatcher() override;

    VoidResult initialize(WatchCallback callback) override;
    void shutdown() override;
    VoidResult addWatch(const std::string& path) override;
    VoidResult removeWatch(const std::string& path) override;
    VoidResult addWatchRecursive(const std::string& path) override;
    bool isWatching(const std::string& path) const override;
    size_t getWatchCount() const override;
    std::string getName() const override { return "inotify"; }

private:
    struct PendingMove {
        uint32_t cookie;
        std::string path;
        bool isDirectory;
    };

    void monitorLoop();
    void emit(WatchEventType type, std::vector<std::string> paths, bool isDirectory);
    void emitError(Error error);
    void watchNewDirectory(const std::string& path);
    void flushPendingMove(std::optional<PendingMove>& pending);
    void forgetWatch(int wd);
    void renameWatchedTree(const std::string& from, const std::string& to);
    void renameWatchedTreeLocked(const std::string& from, const std::string& to);
    // Removes the kernel watches of a directory that left the watched tree
    void dropWatchedTree(const std::string& path);
    static bool isSameOrBelow(const std::string& path, const std::string& root);
    std::string getWatchPath(int wd) const;

    int inotifyFd_{-1};
    std::atomic<bool> running_{false};
    std::thread watcherThread_;
    WatchCallback callback_;

    mutable std::mutex watchMutex_;
    std::map<int, std::string> watchDescriptors_;  // wd -> path
    std::map<std::string, int> pathToWd_;          // path -> wd
};

} // namespace Watch
} // namespace SettleFS
