#include "DebouncedEvent.h"

namespace SettleFS {

std::string kindToString(DebouncedEventKind kind) {
    switch (kind) {
        case DebouncedEventKind::Any: return "Any";
        case DebouncedEventKind::AnyContinuous: return "AnyContinuous";
        default: return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& os, const DebouncedEvent& event) {
    return os << kindToString(event.kind) << "(" << event.path << ")";
}

} // namespace SettleFS
