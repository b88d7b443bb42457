#ifndef EXPORTFLOW_ERROR_HANDLER_H
#define EXPORTFLOW_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <vector>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>

namespace exportflow {

enum class ErrorType {
    CONNECTION,
    CONTROL_RESOLUTION,
    EXPORT_TIMEOUT,
    VALIDATION,
    EXPORT_CONTENT,
    CLIPBOARD,
    PLATFORM,
    CONFIGURATION,
    RUN_IN_PROGRESS,
    UNKNOWN
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string errorTypeToString(ErrorType type);
std::string errorSeverityToString(ErrorSeverity severity);

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief Root of every failure the automation core reports upward
 *
 * Subclasses add structured fields; callers branch with catch clauses or
 * on type(). Anything not covered by a subclass is thrown as a plain
 * AutomationError with a specific ErrorType.
 */
class AutomationError : public std::exception {
public:
    explicit AutomationError(ErrorInfo info) : m_info(std::move(info)) {}
    AutomationError(ErrorType type, const std::string& message,
                    const std::string& details = "", const std::string& context = "")
        : m_info(type, ErrorSeverity::HIGH, message, details, context) {}

    const char* what() const noexcept override { return m_info.message.c_str(); }

    const ErrorInfo& getErrorInfo() const { return m_info; }
    ErrorType type() const { return m_info.type; }

    // Structured fields for logs and the CLI error object
    virtual nlohmann::json toJson() const;

private:
    ErrorInfo m_info;
};

class ConnectionError : public AutomationError {
public:
    ConnectionError(const std::string& message,
                    const std::string& serverLabel,
                    const std::string& connectionLabel,
                    const std::string& details = "");

    const std::string& serverLabel() const { return m_serverLabel; }
    const std::string& connectionLabel() const { return m_connectionLabel; }
    nlohmann::json toJson() const override;

private:
    std::string m_serverLabel;
    std::string m_connectionLabel;
};

/**
 * @brief A screen element could not be located or driven
 */
class ControlResolutionError : public AutomationError {
public:
    explicit ControlResolutionError(const std::string& controlId,
                                    const std::string& details = "");

    const std::string& controlId() const { return m_controlId; }
    nlohmann::json toJson() const override;

private:
    std::string m_controlId;
};

class ExportTimeoutError : public AutomationError {
public:
    ExportTimeoutError(const std::string& directory,
                       const std::string& pattern,
                       std::chrono::milliseconds timeout,
                       std::chrono::milliseconds elapsed);

    const std::string& directory() const { return m_directory; }
    const std::string& pattern() const { return m_pattern; }
    std::chrono::milliseconds timeout() const { return m_timeout; }
    std::chrono::milliseconds elapsed() const { return m_elapsed; }
    nlohmann::json toJson() const override;

private:
    std::string m_directory;
    std::string m_pattern;
    std::chrono::milliseconds m_timeout;
    std::chrono::milliseconds m_elapsed;
};

class ValidationError : public AutomationError {
public:
    ValidationError(const std::string& field, const std::string& message);

    const std::string& field() const { return m_field; }
    nlohmann::json toJson() const override;

private:
    std::string m_field;
};

/**
 * @brief Records surfaced errors and logs them at a severity-derived level
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void record(const AutomationError& error);
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    static constexpr size_t kMaxHistory = 200;

    mutable std::mutex m_mutex;
    std::vector<ErrorInfo> m_errorHistory;
};

} // namespace exportflow

#endif // EXPORTFLOW_ERROR_HANDLER_H
