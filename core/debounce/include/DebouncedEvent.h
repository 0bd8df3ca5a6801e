#pragma once

#include "Result.h"
#include <string>
#include <vector>
#include <ostream>

namespace SettleFS {

/**
 * @brief What a debounced event means
 *
 * Any: the path has been quiet for at least the debounce timeout.
 * AnyContinuous: the path has been changing for at least the timeout and
 * is still changing. Repeats on every tick until the path goes quiet.
 */
enum class DebouncedEventKind {
    Any,
    AnyContinuous
};

struct DebouncedEvent {
    std::string path;
    DebouncedEventKind kind{DebouncedEventKind::Any};

    DebouncedEvent() = default;
    DebouncedEvent(std::string p, DebouncedEventKind k)
        : path(std::move(p)), kind(k) {}

    bool operator==(const DebouncedEvent& other) const {
        return path == other.path && kind == other.kind;
    }
    bool operator!=(const DebouncedEvent& other) const {
        return !(*this == other);
    }
};

/**
 * @brief One delivery to the consumer
 *
 * Either a non-empty batch of events or a non-empty batch of errors.
 */
using DebounceResult = Result<std::vector<DebouncedEvent>, std::vector<Error>>;

std::string kindToString(DebouncedEventKind kind);

std::ostream& operator<<(std::ostream& os, const DebouncedEvent& event);

} // namespace SettleFS
