#include "ErrorCodes.h"

namespace SettleFS {
namespace Core {

const std::unordered_map<ErrorCode, std::string>& ErrorRegistry::messages() {
    static const std::unordered_map<ErrorCode, std::string> errorMessages = {
        {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"},
        {ErrorCode::INVALID_TICK_INTERVAL, "Invalid tick interval"},
        {ErrorCode::INVALID_TIMEOUT, "Invalid debounce timeout"},

        {ErrorCode::WATCHER_INIT_FAILED, "Failed to initialize watcher backend"},
        {ErrorCode::WATCH_ADD_FAILED, "Failed to add watch"},
        {ErrorCode::WATCH_REMOVE_FAILED, "Failed to remove watch"},
        {ErrorCode::WATCHER_IO_ERROR, "Watcher backend I/O error"},
        {ErrorCode::WATCH_QUEUE_OVERFLOW, "Watcher event queue overflowed, events were lost"},

        {ErrorCode::LOCK_FAILURE, "Failed to access debouncer cache"},
        {ErrorCode::INTERNAL_ERROR, "Internal error"},

        {ErrorCode::SUCCESS, "Operation successful"}
    };
    return errorMessages;
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    auto it = messages().find(code);
    if (it != messages().end()) {
        return it->second;
    }
    return "Unknown error";
}

std::string ErrorRegistry::getErrorCodeString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::INVALID_TICK_INTERVAL: return "INVALID_TICK_INTERVAL";
        case ErrorCode::INVALID_TIMEOUT: return "INVALID_TIMEOUT";
        case ErrorCode::WATCHER_INIT_FAILED: return "WATCHER_INIT_FAILED";
        case ErrorCode::WATCH_ADD_FAILED: return "WATCH_ADD_FAILED";
        case ErrorCode::WATCH_REMOVE_FAILED: return "WATCH_REMOVE_FAILED";
        case ErrorCode::WATCHER_IO_ERROR: return "WATCHER_IO_ERROR";
        case ErrorCode::WATCH_QUEUE_OVERFLOW: return "WATCH_QUEUE_OVERFLOW";
        case ErrorCode::LOCK_FAILURE: return "LOCK_FAILURE";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

Error ErrorRegistry::makeError(ErrorCode code, const std::string& details,
                               const std::string& component) {
    std::string message = getMessage(code);
    if (!details.empty()) {
        message += ": " + details;
    }
    return Error(message, static_cast<int>(code), component);
}

} // namespace Core
} // namespace SettleFS
