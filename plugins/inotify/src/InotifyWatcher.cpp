#include "InotifyWatcher.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <climits>
#include <utility>
#include <vector>

namespace SettleFS {
namespace Watch {

namespace {

const char* COMPONENT = "InotifyWatcher";

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_DELETE | IN_MODIFY | IN_MOVED_FROM | IN_MOVED_TO |
                                IN_CLOSE_WRITE | IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF;

} // namespace

InotifyWatcher::InotifyWatcher() = default;

InotifyWatcher::~InotifyWatcher() {
    shutdown();
}

VoidResult InotifyWatcher::initialize(WatchCallback callback) {
    using Core::ErrorCode;
    using Core::ErrorRegistry;

    if (running_) {
        return ErrorRegistry::makeError(ErrorCode::WATCHER_INIT_FAILED, "already initialized", COMPONENT);
    }
    if (!callback) {
        return ErrorRegistry::makeError(ErrorCode::WATCHER_INIT_FAILED, "callback is empty", COMPONENT);
    }

    callback_ = std::move(callback);

    inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) {
        auto error = ErrorRegistry::makeError(ErrorCode::WATCHER_INIT_FAILED, strerror(errno), COMPONENT);
        Logger::instance().error(error.message, COMPONENT);
        return error;
    }

    running_ = true;
    watcherThread_ = std::thread(&InotifyWatcher::monitorLoop, this);

    Logger::instance().info("inotify watcher initialized", COMPONENT);
    return Ok();
}

void InotifyWatcher::shutdown() {
    bool wasRunning = running_.exchange(false);

    if (watcherThread_.joinable()) {
        watcherThread_.join();
    }

    if (inotifyFd_ >= 0) {
        close(inotifyFd_);
        inotifyFd_ = -1;
    }

    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        watchDescriptors_.clear();
        pathToWd_.clear();
    }

    if (wasRunning) {
        Logger::instance().info("inotify watcher shut down", COMPONENT);
    }
}

VoidResult InotifyWatcher::addWatch(const std::string& path) {
    using Core::ErrorCode;
    using Core::ErrorRegistry;

    if (inotifyFd_ < 0) {
        return ErrorRegistry::makeError(ErrorCode::WATCH_ADD_FAILED, path + ": watcher not initialized", COMPONENT);
    }

    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        if (pathToWd_.count(path) > 0) {
            return Ok();
        }
    }

    int wd = inotify_add_watch(inotifyFd_, path.c_str(), WATCH_MASK);
    if (wd < 0) {
        auto error = ErrorRegistry::makeError(ErrorCode::WATCH_ADD_FAILED,
                                              path + ": " + strerror(errno), COMPONENT);
        Logger::instance().error(error.message, COMPONENT);
        return error;
    }

    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        auto existing = watchDescriptors_.find(wd);
        if (existing != watchDescriptors_.end() && existing->second != path) {
            // Same directory reached under a new name, the old one is stale
            renameWatchedTreeLocked(existing->second, path);
            return Ok();
        }
        watchDescriptors_[wd] = path;
        pathToWd_[path] = wd;
    }

    // Per-watch logging is debug only; addWatchRecursive logs a summary
    LOG_DEBUG_COMP_IF("Watching " + path, COMPONENT);
    return Ok();
}

VoidResult InotifyWatcher::removeWatch(const std::string& path) {
    std::lock_guard<std::mutex> lock(watchMutex_);

    auto it = pathToWd_.find(path);
    if (it == pathToWd_.end()) {
        return Core::ErrorRegistry::makeError(Core::ErrorCode::WATCH_REMOVE_FAILED,
                                              path + ": not watched", COMPONENT);
    }

    int wd = it->second;
    watchDescriptors_.erase(wd);
    pathToWd_.erase(it);

    if (inotify_rm_watch(inotifyFd_, wd) < 0) {
        // The kernel drops watches of deleted directories on its own
        LOG_DEBUG_COMP_IF("inotify_rm_watch(" + path + "): " + strerror(errno), COMPONENT);
    }
    return Ok();
}

VoidResult InotifyWatcher::addWatchRecursive(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!fs::exists(path, ec)) {
        return Core::ErrorRegistry::makeError(Core::ErrorCode::WATCH_ADD_FAILED,
                                              path + ": no such file or directory", COMPONENT);
    }

    size_t initialCount = getWatchCount();
    auto result = addWatch(path);
    if (!result) {
        return result;
    }

    size_t skipped = 0;
    if (fs::is_directory(path, ec)) {
        for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
             it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                // One unreadable subdirectory does not drop the rest
                if (!addWatch(it->path().string())) {
                    skipped++;
                }
            }
        }
    }

    size_t addedCount = getWatchCount() - initialCount;
    if (addedCount > 0) {
        LOG_DEBUG_COMP_IF("Added " + std::to_string(addedCount) + " inotify watches for " + path, COMPONENT);
    }
    if (skipped > 0) {
        Logger::instance().warn("Skipped " + std::to_string(skipped) + " unwatchable directories under " + path,
                                COMPONENT);
    }
    return Ok();
}

bool InotifyWatcher::isWatching(const std::string& path) const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    return pathToWd_.count(path) > 0;
}

size_t InotifyWatcher::getWatchCount() const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    return watchDescriptors_.size();
}

std::string InotifyWatcher::getWatchPath(int wd) const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    auto it = watchDescriptors_.find(wd);
    return it != watchDescriptors_.end() ? it->second : "";
}

void InotifyWatcher::forgetWatch(int wd) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    auto it = watchDescriptors_.find(wd);
    if (it != watchDescriptors_.end()) {
        pathToWd_.erase(it->second);
        watchDescriptors_.erase(it);
    }
}

void InotifyWatcher::renameWatchedTree(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    renameWatchedTreeLocked(from, to);
}

void InotifyWatcher::renameWatchedTreeLocked(const std::string& from, const std::string& to) {
    std::vector<std::pair<std::string, int>> moved;
    for (auto it = pathToWd_.begin(); it != pathToWd_.end();) {
        if (isSameOrBelow(it->first, from)) {
            moved.emplace_back(to + it->first.substr(from.size()), it->second);
            it = pathToWd_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& [path, wd] : moved) {
        watchDescriptors_[wd] = path;
        pathToWd_[path] = wd;
    }
    if (!moved.empty()) {
        LOG_DEBUG_COMP_IF("Re-keyed " + std::to_string(moved.size()) + " watches from " + from + " to " + to,
                          COMPONENT);
    }
}

void InotifyWatcher::dropWatchedTree(const std::string& path) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    for (auto it = pathToWd_.begin(); it != pathToWd_.end();) {
        if (!isSameOrBelow(it->first, path)) {
            ++it;
            continue;
        }
        if (inotify_rm_watch(inotifyFd_, it->second) < 0) {
            LOG_DEBUG_COMP_IF("inotify_rm_watch(" + it->first + "): " + strerror(errno), COMPONENT);
        }
        watchDescriptors_.erase(it->second);
        it = pathToWd_.erase(it);
    }
}

bool InotifyWatcher::isSameOrBelow(const std::string& path, const std::string& root) {
    if (path.compare(0, root.size(), root) != 0) {
        return false;
    }
    return path.size() == root.size() || path[root.size()] == '/';
}

void InotifyWatcher::emit(WatchEventType type, std::vector<std::string> paths, bool isDirectory) {
    WatchEvent event;
    event.type = type;
    event.paths = std::move(paths);
    event.isDirectory = isDirectory;
    callback_(Result<WatchEvent>(std::move(event)));
}

void InotifyWatcher::emitError(Error error) {
    Logger::instance().error(error.message, COMPONENT);
    callback_(Result<WatchEvent>(std::move(error)));
}

void InotifyWatcher::watchNewDirectory(const std::string& path) {
    auto added = addWatchRecursive(path);
    if (!added) {
        emitError(added.error());
    }
}

// A move whose IN_MOVED_TO half never arrived left the watched tree
void InotifyWatcher::flushPendingMove(std::optional<PendingMove>& pending) {
    if (pending) {
        emit(WatchEventType::Rename, {pending->path}, pending->isDirectory);
        if (pending->isDirectory) {
            dropWatchedTree(pending->path);
        }
        pending.reset();
    }
}

void InotifyWatcher::monitorLoop() {
    using Core::ErrorCode;
    using Core::ErrorRegistry;

    const size_t EVENT_SIZE = sizeof(struct inotify_event);
    const size_t BUF_LEN = 1024 * (EVENT_SIZE + NAME_MAX + 1);
    std::vector<char> buffer(BUF_LEN);

    while (running_) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(inotifyFd_, &fds);

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 100000;  // 100ms

        int ret = select(inotifyFd_ + 1, &fds, nullptr, nullptr, &timeout);

        if (ret < 0) {
            if (errno == EINTR) continue;
            if (running_) {
                emitError(ErrorRegistry::makeError(ErrorCode::WATCHER_IO_ERROR,
                    std::string("select: ") + strerror(errno), COMPONENT));
            }
            break;
        }

        if (ret == 0) continue;  // Timeout

        ssize_t len = read(inotifyFd_, buffer.data(), buffer.size());
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            if (running_) {
                emitError(ErrorRegistry::makeError(ErrorCode::WATCHER_IO_ERROR,
                    std::string("read: ") + strerror(errno), COMPONENT));
            }
            break;
        }

        std::optional<PendingMove> pendingMove;

        size_t i = 0;
        while (i < static_cast<size_t>(len)) {
            auto* event = reinterpret_cast<struct inotify_event*>(&buffer[i]);
            i += EVENT_SIZE + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                flushPendingMove(pendingMove);
                emitError(ErrorRegistry::makeError(ErrorCode::WATCH_QUEUE_OVERFLOW, "", COMPONENT));
                continue;
            }

            if (event->mask & IN_IGNORED) {
                forgetWatch(event->wd);
                continue;
            }

            std::string dirPath = getWatchPath(event->wd);
            if (dirPath.empty()) {
                continue;
            }

            bool isDir = (event->mask & IN_ISDIR) != 0;

            if (event->len == 0) {
                // Events about the watched path itself
                if (event->mask & IN_DELETE_SELF) {
                    flushPendingMove(pendingMove);
                    emit(WatchEventType::Delete, {dirPath}, true);
                } else if (event->mask & IN_MOVE_SELF) {
                    emit(WatchEventType::Rename, {dirPath}, true);
                } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
                    emit(WatchEventType::Modify, {dirPath}, false);
                } else if (event->mask & IN_ATTRIB) {
                    emit(WatchEventType::AttribChange, {dirPath}, false);
                }
                continue;
            }

            std::string fullPath = dirPath + "/" + event->name;

            if (event->mask & IN_MOVED_TO) {
                if (pendingMove && pendingMove->cookie == event->cookie) {
                    emit(WatchEventType::Rename, {pendingMove->path, fullPath}, isDir);
                    if (isDir) {
                        renameWatchedTree(pendingMove->path, fullPath);
                    }
                    pendingMove.reset();
                } else {
                    flushPendingMove(pendingMove);
                    emit(WatchEventType::Rename, {fullPath}, isDir);
                }
                if (isDir) {
                    watchNewDirectory(fullPath);
                }
                continue;
            }

            flushPendingMove(pendingMove);

            if (event->mask & IN_MOVED_FROM) {
                pendingMove = PendingMove{event->cookie, fullPath, isDir};
            } else if (event->mask & IN_CREATE) {
                emit(WatchEventType::Create, {fullPath}, isDir);
                // New directories get their own watches
                if (isDir) {
                    watchNewDirectory(fullPath);
                }
            } else if (event->mask & IN_DELETE) {
                emit(WatchEventType::Delete, {fullPath}, isDir);
            } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
                if (!isDir) {
                    emit(WatchEventType::Modify, {fullPath}, false);
                }
            } else if (event->mask & IN_ATTRIB) {
                emit(WatchEventType::AttribChange, {fullPath}, isDir);
            }
        }

        flushPendingMove(pendingMove);
    }
}

} // namespace Watch
} // namespace SettleFS
