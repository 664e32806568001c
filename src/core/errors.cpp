#include <metricstream/core/errors.hpp>

namespace MetricStream {

namespace {

std::string describe(std::exception_ptr cause) {
    if (!cause) return {};
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

std::string render(const char* kind, const std::string& operation,
                   const std::string& message, std::exception_ptr cause) {
    std::string text = std::string(kind) + "[" + operation + "]: " + message;
    std::string reason = describe(cause);
    if (!reason.empty()) {
        text += " (" + reason + ")";
    }
    return text;
}

} // namespace

MetricStreamError::MetricStreamError(const char* kind,
                                     std::string operation,
                                     std::string message,
                                     std::exception_ptr cause)
    : std::runtime_error(render(kind, operation, message, cause)),
      kind_(kind),
      operation_(std::move(operation)),
      message_(std::move(message)),
      cause_(cause) {}

std::string MetricStreamError::causeMessage() const {
    return describe(cause_);
}

BatchError::BatchError(std::string operation, std::string batchId,
                       std::string message, std::exception_ptr cause,
                       std::vector<std::string> partialFailures)
    : MetricStreamError("BatchError", std::move(operation), std::move(message), cause),
      batch_id_(std::move(batchId)),
      partial_failures_(std::move(partialFailures)) {}

std::string errorKindOf(std::exception_ptr error) {
    if (!error) return "Unknown";
    try {
        std::rethrow_exception(error);
    } catch (const MetricStreamError& e) {
        return e.kindName();
    } catch (const std::exception&) {
        return "Unknown";
    }
    return "Unknown";
}

} // namespace MetricStream
