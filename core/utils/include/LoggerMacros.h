/**
 * @file LoggerMacros.h
 * @brief Conditional logging macros
 *
 * The *_IF macros skip message construction when the level is disabled,
 * which matters on hot paths such as the watcher callback:
 *   LOG_DEBUG_COMP_IF("Raw event for " + path, "Debouncer");
 */

#pragma once

#include "Logger.h"

namespace SettleFS {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::SettleFS::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::SettleFS::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::SettleFS::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::SettleFS::Logger::instance().critical(msg, component)

} // namespace SettleFS
