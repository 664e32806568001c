#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace MetricStream {

/**
 * @brief Base of the typed pipeline errors.
 *
 * Carries the failing operation, a human message and the low-level exception
 * that caused it (if any). what() renders "<Kind>[operation]: message (cause)".
 */
class MetricStreamError : public std::runtime_error {
public:
    MetricStreamError(const char* kind,
                      std::string operation,
                      std::string message,
                      std::exception_ptr cause = nullptr);

    const std::string& operation() const noexcept { return operation_; }
    const std::string& message() const noexcept { return message_; }
    std::exception_ptr cause() const noexcept { return cause_; }
    const char* kindName() const noexcept { return kind_; }

    /**
     * @brief what() of the wrapped cause, empty when there is none
     */
    std::string causeMessage() const;

private:
    const char* kind_;
    std::string operation_;
    std::string message_;
    std::exception_ptr cause_;
};

class StorageError : public MetricStreamError {
public:
    StorageError(std::string operation, std::string message,
                 std::exception_ptr cause = nullptr)
        : MetricStreamError("StorageError", std::move(operation),
                            std::move(message), cause) {}
};

class BatchError : public MetricStreamError {
public:
    BatchError(std::string operation, std::string batchId, std::string message,
               std::exception_ptr cause = nullptr,
               std::vector<std::string> partialFailures = {});

    const std::string& batchId() const noexcept { return batch_id_; }

    // Correlation ids of the items that were not stored
    const std::vector<std::string>& partialFailures() const noexcept { return partial_failures_; }

private:
    std::string batch_id_;
    std::vector<std::string> partial_failures_;
};

class RetentionError : public MetricStreamError {
public:
    RetentionError(std::string operation, std::string message,
                   std::exception_ptr cause = nullptr)
        : MetricStreamError("RetentionError", std::move(operation),
                            std::move(message), cause) {}
};

/**
 * @brief Kind name of an arbitrary exception ("StorageError", ..., or "Unknown")
 */
std::string errorKindOf(std::exception_ptr error);

} // namespace MetricStream
