#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace streamingcore {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for better classification
 */
enum class ErrorCategory {
    MEMORY_MONITORING,
    NETWORK_MONITORING,
    BUFFER_MANAGEMENT,
    RESOURCE_CLEANUP,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

const char* categoryName(ErrorCategory category);
const char* severityName(ErrorSeverity severity);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "");
};

/**
 * Base exception carrying structured error information
 */
class StreamingCoreException : public std::exception {
public:
    explicit StreamingCoreException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class ConfigurationException : public StreamingCoreException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

class SamplingException : public StreamingCoreException {
public:
    SamplingException(const std::string& message, ErrorCategory category,
                      const std::string& context = "");
};

class CleanupException : public StreamingCoreException {
public:
    CleanupException(const std::string& message, const std::string& resource = "");
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Process-wide error reporter. Logs every report, keeps a bounded history
 * and forwards reports to an optional callback.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "");

    void setErrorCallback(ErrorCallback callback);

    size_t getErrorCount() const;
    size_t getErrorCount(ErrorCategory category) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

} // namespace utils
} // namespace streamingcore
