#pragma once

#include <string>
#include <unordered_map>

#include "Result.h"

namespace SettleFS {
namespace Core {

enum class ErrorCode : int {
    // Configuration Errors (1000-1999)
    INVALID_CONFIGURATION = 1000,
    INVALID_TICK_INTERVAL = 1001,
    INVALID_TIMEOUT = 1002,

    // Watcher Backend Errors (2000-2999)
    WATCHER_INIT_FAILED = 2000,
    WATCH_ADD_FAILED = 2001,
    WATCH_REMOVE_FAILED = 2002,
    WATCHER_IO_ERROR = 2003,
    WATCH_QUEUE_OVERFLOW = 2004,

    // Internal Errors (5000-5999)
    LOCK_FAILURE = 5000,
    INTERNAL_ERROR = 5001,

    SUCCESS = 0
};

class ErrorRegistry {
public:
    static std::string getMessage(ErrorCode code);
    static std::string getErrorCodeString(ErrorCode code);

    /**
     * @brief Build an Error whose message is the registered text for code,
     *        followed by details when given
     */
    static Error makeError(ErrorCode code, const std::string& details = "",
                           const std::string& component = "");

private:
    static const std::unordered_map<ErrorCode, std::string>& messages();
};

inline bool hasCode(const Error& error, ErrorCode code) {
    return error.code == static_cast<int>(code);
}

} // namespace Core
} // namespace SettleFS
