#pragma once

#include "Config.h"
#include "EventStore.h"
#include "Result.h"
#include <chrono>
#include <optional>

namespace SettleFS {

/**
 * @brief Construction parameters of a Debouncer
 */
struct DebounceSettings {
    static constexpr int DEFAULT_TIMEOUT_MS = 2000;
    static constexpr int TICK_DIVISOR = 4;

    Duration timeout{std::chrono::milliseconds(DEFAULT_TIMEOUT_MS)};
    std::optional<Duration> tickInterval;

    DebounceSettings() = default;
    explicit DebounceSettings(Duration t, std::optional<Duration> tick = std::nullopt)
        : timeout(t), tickInterval(tick) {}

    /**
     * @brief Effective tick interval
     *
     * An explicit tick must be positive and no larger than the timeout.
     * Without one the tick is timeout / 4, which must stay positive.
     */
    Result<Duration> resolveTick() const;

    /**
     * @brief Read debounce_timeout_ms and tick_interval_ms
     *
     * Missing keys fall back to the defaults; malformed or negative values
     * are configuration errors.
     */
    static Result<DebounceSettings> fromConfig(const Config& config);
};

} // namespace SettleFS
