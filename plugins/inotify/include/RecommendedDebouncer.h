#pragma once

#include "Debouncer.h"

namespace SettleFS {
namespace Watch {

/**
 * @brief Debouncer over the platform's preferred watcher (inotify)
 *
 * Paths are added afterwards through Debouncer::watcher().
 */
Result<std::unique_ptr<Debouncer>> makeRecommendedDebouncer(Duration timeout,
                                                            std::optional<Duration> tickInterval,
                                                            std::shared_ptr<IEventSink> sink);

Result<std::unique_ptr<Debouncer>> makeRecommendedDebouncer(Duration timeout,
                                                            std::optional<Duration> tickInterval,
                                                            CallbackSink::Handler handler);

} // namespace Watch
} // namespace SettleFS
