#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <windows.h>
#undef ERROR
#endif

namespace exportflow {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &time_t);
#else
        localtime_r(&time_t, &local);
#endif
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

LogLevel logLevelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);
    if (!entry.run_id.empty()) {
        log_json["run_id"] = entry.run_id;
    }

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.operation_name.empty()) {
        log_json["operation"] = entry.operation_name;
        log_json["duration_ms"] = entry.duration.count() / 1000000.0;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return log_json.dump() + "\n";
}

std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    if (!entry.run_id.empty()) {
        ss << "[" << entry.run_id << "] ";
    }

    ss << entry.message;

    // Source location only for errors and above
    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        ss << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    if (!entry.operation_name.empty()) {
        ss << " [" << entry.operation_name << ": "
           << std::fixed << std::setprecision(2)
           << (entry.duration.count() / 1000000.0) << "ms]";
    }

    if (!entry.context.empty()) {
        ss << " " << entry.context.dump();
    }

    ss << "\n";
    return ss.str();
}

ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(std::move(formatter)) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);
    if (entry.level >= LogLevel::ERROR_LEVEL) {
        std::cerr << formatted;
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout.flush();
    std::cerr.flush();
}

RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(std::move(formatter)), m_current_size(0) {
    fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    openFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openFile();
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size || m_config.max_files == 0) {
        return;
    }

    m_file->close();

    std::error_code ec;
    fs::remove(rotatedName(m_config.max_files), ec);
    for (size_t i = m_config.max_files; i > 1; --i) {
        if (fs::exists(rotatedName(i - 1), ec)) {
            fs::rename(rotatedName(i - 1), rotatedName(i), ec);
        }
    }
    fs::rename(m_config.base_path, rotatedName(1), ec);

    openFile();
}

void RotatingFileLogSink::openFile() {
    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(m_config.base_path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

std::string RotatingFileLogSink::rotatedName(size_t index) const {
    fs::path p(m_config.base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();
    return (p.parent_path() / (stem + "." + std::to_string(index) + ext)).string();
}

ScopedTimer::ScopedTimer(const std::string& operation_name, LogLevel level)
    : m_operation_name(operation_name)
    , m_level(level)
    , m_start(std::chrono::steady_clock::now())
    , m_cancelled(false) {}

ScopedTimer::~ScopedTimer() {
    if (m_cancelled || m_operation_name.empty()) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - m_start);
    StructuredLogger::getInstance().logOperation(m_operation_name, elapsed, m_level);
}

StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(LogLevel::INFO)
    , m_slow_threshold(std::chrono::seconds(30)) {
    m_sinks.push_back(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_min_level = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    return m_min_level;
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::setRunId(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_run_id = run_id;
}

std::string StructuredLogger::getRunId() const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    return m_run_id;
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_slow_threshold = threshold;
}

void StructuredLogger::log(LogEntry entry) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    if (entry.level < m_min_level) {
        return;
    }
    if (entry.run_id.empty()) {
        entry.run_id = m_run_id;
    }
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

void StructuredLogger::logOperation(const std::string& operation,
                                    std::chrono::nanoseconds duration,
                                    LogLevel level) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.operation_name = operation;
    entry.duration = duration;

    std::chrono::milliseconds threshold;
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        threshold = m_slow_threshold;
    }
    if (duration > threshold) {
        entry.level = LogLevel::WARNING;
        entry.message = "Slow operation detected";
    } else {
        entry.level = level;
        entry.message = "Operation completed";
    }

    log(std::move(entry));
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger), m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::operation(const std::string& op) {
    m_entry.operation_name = op;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::duration(std::chrono::nanoseconds ns) {
    m_entry.duration = ns;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(std::move(m_entry));
    }
}

ScopedRunId::ScopedRunId(const std::string& run_id)
    : m_previous(StructuredLogger::getInstance().getRunId()) {
    StructuredLogger::getInstance().setRunId(run_id);
}

ScopedRunId::~ScopedRunId() {
    StructuredLogger::getInstance().setRunId(m_previous);
}

} // namespace exportflow
