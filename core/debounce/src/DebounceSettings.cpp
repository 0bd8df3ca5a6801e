#include "DebounceSettings.h"
#include "ErrorCodes.h"
#include <cctype>

namespace SettleFS {

namespace {

std::string formatMillis(Duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(d).count();
    return std::to_string(ms) + "ms";
}

bool isNonNegativeInt(const std::string&, const std::string& value) {
    if (value.empty() || value.size() > 9) {
        return false;
    }
    for (unsigned char c : value) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<Duration> DebounceSettings::resolveTick() const {
    using Core::ErrorCode;
    using Core::ErrorRegistry;

    if (timeout <= Duration::zero()) {
        return ErrorRegistry::makeError(ErrorCode::INVALID_TIMEOUT,
            "timeout " + formatMillis(timeout) + " must be positive", "Debouncer");
    }

    if (tickInterval) {
        if (*tickInterval > timeout) {
            return ErrorRegistry::makeError(ErrorCode::INVALID_TICK_INTERVAL,
                "tick rate " + formatMillis(*tickInterval) + " > " + formatMillis(timeout) + " timeout",
                "Debouncer");
        }
        if (*tickInterval <= Duration::zero()) {
            return ErrorRegistry::makeError(ErrorCode::INVALID_TICK_INTERVAL,
                "tick rate " + formatMillis(*tickInterval) + " must be positive", "Debouncer");
        }
        return *tickInterval;
    }

    Duration tick = timeout / TICK_DIVISOR;
    if (tick <= Duration::zero()) {
        return ErrorRegistry::makeError(ErrorCode::INVALID_TIMEOUT,
            "failed to calculate tick as " + formatMillis(timeout) + "/" + std::to_string(TICK_DIVISOR),
            "Debouncer");
    }
    return tick;
}

Result<DebounceSettings> DebounceSettings::fromConfig(const Config& config) {
    std::unordered_map<std::string, Config::Validator> schema = {
        {"debounce_timeout_ms", isNonNegativeInt},
        {"tick_interval_ms", isNonNegativeInt},
    };

    std::string failedKey;
    if (!config.validate(schema, &failedKey)) {
        return Core::ErrorRegistry::makeError(Core::ErrorCode::INVALID_CONFIGURATION,
            failedKey + " = '" + config.get(failedKey) + "' is not a non-negative integer", "Config");
    }

    DebounceSettings settings;
    settings.timeout = std::chrono::milliseconds(config.getInt("debounce_timeout_ms", DEFAULT_TIMEOUT_MS));
    if (config.hasKey("tick_interval_ms")) {
        settings.tickInterval = std::chrono::milliseconds(config.getInt("tick_interval_ms"));
    }
    return settings;
}

} // namespace SettleFS
