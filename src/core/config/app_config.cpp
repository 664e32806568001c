#include <metricstream/core/config/app_config.hpp>

namespace MetricStream {

const char* toString(BackendKind kind) {
    switch (kind) {
        case BackendKind::IN_MEMORY: return "in-memory";
        case BackendKind::EXTERNAL:  return "external";
        case BackendKind::HYBRID:    return "hybrid";
        default:                     return "unknown";
    }
}

std::optional<BackendKind> parseBackendKind(const std::string& text) {
    if (text == "in-memory") return BackendKind::IN_MEMORY;
    if (text == "external") return BackendKind::EXTERNAL;
    if (text == "hybrid") return BackendKind::HYBRID;
    return std::nullopt;
}

} // namespace MetricStream
