#ifndef EXPORTFLOW_STRUCTURED_LOGGER_H
#define EXPORTFLOW_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <thread>
#include <mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

namespace exportflow {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // ERROR collides with the Windows macro
    CRITICAL
};

LogLevel logLevelFromString(const std::string& name);
std::string logLevelToString(LogLevel level);

/**
 * @brief One structured log record
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string run_id;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line, for files consumed by log shippers
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Console sink; errors and above go to stderr
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File sink that rotates by size: app.log -> app.1.log -> ... -> app.N.log
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openFile();
    std::string rotatedName(size_t index) const;
};

/**
 * @brief Logs the lifetime of a scope as an operation with a duration
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name,
                         LogLevel level = LogLevel::DEBUG);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void cancel() { m_cancelled = true; }

private:
    std::string m_operation_name;
    LogLevel m_level;
    std::chrono::steady_clock::time_point m_start;
    bool m_cancelled;
};

class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);

    // Correlation id stamped on every entry; empty means none
    void setRunId(const std::string& run_id);
    std::string getRunId() const;

    void log(LogEntry entry);
    void logOperation(const std::string& operation,
                      std::chrono::nanoseconds duration,
                      LogLevel level);

    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);
        LogBuilder& operation(const std::string& op);
        LogBuilder& duration(std::chrono::nanoseconds ns);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    LogLevel m_min_level;
    std::string m_run_id;
    std::chrono::milliseconds m_slow_threshold;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;
};

/**
 * @brief Installs a run id for the lifetime of the guard and restores the previous one
 */
class ScopedRunId {
public:
    explicit ScopedRunId(const std::string& run_id);
    ~ScopedRunId();

    ScopedRunId(const ScopedRunId&) = delete;
    ScopedRunId& operator=(const ScopedRunId&) = delete;

private:
    std::string m_previous;
};

#define SLOG_DEBUG() exportflow::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() exportflow::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() exportflow::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() exportflow::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() exportflow::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) exportflow::ScopedTimer _timer(operation)
#define SCOPED_TIMER_LEVEL(operation, level) exportflow::ScopedTimer _timer(operation, level)

} // namespace exportflow

#endif // EXPORTFLOW_STRUCTURED_LOGGER_H
