#include "error_handler.h"
#include "structured_logger.h"

namespace exportflow {

std::string errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::CONNECTION: return "CONNECTION";
        case ErrorType::CONTROL_RESOLUTION: return "CONTROL_RESOLUTION";
        case ErrorType::EXPORT_TIMEOUT: return "EXPORT_TIMEOUT";
        case ErrorType::VALIDATION: return "VALIDATION";
        case ErrorType::EXPORT_CONTENT: return "EXPORT_CONTENT";
        case ErrorType::CLIPBOARD: return "CLIPBOARD";
        case ErrorType::PLATFORM: return "PLATFORM";
        case ErrorType::CONFIGURATION: return "CONFIGURATION";
        case ErrorType::RUN_IN_PROGRESS: return "RUN_IN_PROGRESS";
        case ErrorType::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

nlohmann::json AutomationError::toJson() const {
    nlohmann::json j;
    j["error_type"] = errorTypeToString(m_info.type);
    j["message"] = m_info.message;
    if (!m_info.details.empty()) {
        j["details"] = m_info.details;
    }
    if (!m_info.context.empty()) {
        j["context"] = m_info.context;
    }
    return j;
}

ConnectionError::ConnectionError(const std::string& message,
                                 const std::string& serverLabel,
                                 const std::string& connectionLabel,
                                 const std::string& details)
    : AutomationError(ErrorInfo(ErrorType::CONNECTION, ErrorSeverity::CRITICAL,
                                message, details, "SessionConnector"))
    , m_serverLabel(serverLabel)
    , m_connectionLabel(connectionLabel) {}

nlohmann::json ConnectionError::toJson() const {
    auto j = AutomationError::toJson();
    j["server_label"] = m_serverLabel;
    j["connection_label"] = m_connectionLabel;
    return j;
}

ControlResolutionError::ControlResolutionError(const std::string& controlId,
                                               const std::string& details)
    : AutomationError(ErrorInfo(ErrorType::CONTROL_RESOLUTION, ErrorSeverity::HIGH,
                                "Control not found: " + controlId, details, controlId))
    , m_controlId(controlId) {}

nlohmann::json ControlResolutionError::toJson() const {
    auto j = AutomationError::toJson();
    j["control_id"] = m_controlId;
    return j;
}

ExportTimeoutError::ExportTimeoutError(const std::string& directory,
                                       const std::string& pattern,
                                       std::chrono::milliseconds timeout,
                                       std::chrono::milliseconds elapsed)
    : AutomationError(ErrorInfo(ErrorType::EXPORT_TIMEOUT, ErrorSeverity::HIGH,
                                "Export file not detected in " + directory +
                                " matching '" + pattern + "'",
                                "timeout_ms=" + std::to_string(timeout.count()) +
                                " elapsed_ms=" + std::to_string(elapsed.count()),
                                directory))
    , m_directory(directory)
    , m_pattern(pattern)
    , m_timeout(timeout)
    , m_elapsed(elapsed) {}

nlohmann::json ExportTimeoutError::toJson() const {
    auto j = AutomationError::toJson();
    j["directory"] = m_directory;
    j["pattern"] = m_pattern;
    j["timeout_ms"] = m_timeout.count();
    j["elapsed_ms"] = m_elapsed.count();
    return j;
}

ValidationError::ValidationError(const std::string& field, const std::string& message)
    : AutomationError(ErrorInfo(ErrorType::VALIDATION, ErrorSeverity::MEDIUM,
                                message, "", field))
    , m_field(field) {}

nlohmann::json ValidationError::toJson() const {
    auto j = AutomationError::toJson();
    j["field"] = m_field;
    return j;
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::record(const AutomationError& error) {
    const ErrorInfo& info = error.getErrorInfo();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(info);
        if (m_errorHistory.size() > kMaxHistory) {
            m_errorHistory.erase(m_errorHistory.begin());
        }
    }

    nlohmann::json fields = error.toJson();
    switch (info.severity) {
        case ErrorSeverity::LOW:
            SLOG_DEBUG().message(info.message).context("error", fields)
                .context("severity", errorSeverityToString(info.severity));
            break;
        case ErrorSeverity::MEDIUM:
            SLOG_WARNING().message(info.message).context("error", fields)
                .context("severity", errorSeverityToString(info.severity));
            break;
        case ErrorSeverity::HIGH:
            SLOG_ERROR().message(info.message).context("error", fields)
                .context("severity", errorSeverityToString(info.severity));
            break;
        case ErrorSeverity::CRITICAL:
        default:
            SLOG_CRITICAL().message(info.message).context("error", fields)
                .context("severity", errorSeverityToString(info.severity));
            break;
    }
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + start, m_errorHistory.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

} // namespace exportflow
