#include "RecommendedDebouncer.h"
#include "InotifyWatcher.h"

namespace SettleFS {
namespace Watch {

Result<std::unique_ptr<Debouncer>> makeRecommendedDebouncer(Duration timeout,
                                                            std::optional<Duration> tickInterval,
                                                            std::shared_ptr<IEventSink> sink) {
    return makeDebouncer(DebounceSettings(timeout, tickInterval), std::move(sink),
                         std::make_unique<InotifyWatcher>());
}

Result<std::unique_ptr<Debouncer>> makeRecommendedDebouncer(Duration timeout,
                                                            std::optional<Duration> tickInterval,
                                                            CallbackSink::Handler handler) {
    return makeDebouncer(DebounceSettings(timeout, tickInterval), std::move(handler),
                         std::make_unique<InotifyWatcher>());
}

} // namespace Watch
} // namespace SettleFS
