#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace streamingcore {
namespace utils {

const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MEMORY_MONITORING: return "MemoryMonitoring";
        case ErrorCategory::NETWORK_MONITORING: return "NetworkMonitoring";
        case ErrorCategory::BUFFER_MANAGEMENT: return "BufferManagement";
        case ErrorCategory::RESOURCE_CLEANUP: return "ResourceCleanup";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

const char* severityName(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()) {

    // Generate unique error ID
    static std::mutex id_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    std::lock_guard<std::mutex> lock(id_mutex);
    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// StreamingCoreException implementation
StreamingCoreException::StreamingCoreException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* StreamingCoreException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : StreamingCoreException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                       message, details, "Configuration")) {
}

SamplingException::SamplingException(const std::string& message, ErrorCategory category,
                                     const std::string& context)
    : StreamingCoreException(ErrorInfo(category, ErrorSeverity::WARNING,
                                       message, "", context.empty() ? "Sampling" : context)) {
}

CleanupException::CleanupException(const std::string& message, const std::string& resource)
    : StreamingCoreException(ErrorInfo(ErrorCategory::RESOURCE_CLEANUP, ErrorSeverity::ERROR,
                                       message, "", resource.empty() ? "ResourceCleanup" : resource)) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }

        callback = error_callback_;
    }

    // Callback runs unlocked so it may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) {
    if (auto streaming = dynamic_cast<const StreamingCoreException*>(&e)) {
        ErrorInfo error = streaming->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        reportError(error);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_history_.size();
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        }));
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(max_size, 1);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryName(error.category)
                << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

} // namespace utils
} // namespace streamingcore
