#include "test_support.h"
#include "common/structured_logger.h"

using namespace exportflow;
using namespace exportflow::testing;

namespace {

class CapturingSink : public ILogSink {
public:
    void write(const LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries.push_back(entry);
    }
    void flush() override {}

    std::vector<LogEntry> entries;

private:
    std::mutex m_mutex;
};

// Attaches a capturing sink for the lifetime of the guard
struct Capture {
    std::shared_ptr<CapturingSink> sink = std::make_shared<CapturingSink>();
    LogLevel previousLevel;

    explicit Capture(LogLevel level = LogLevel::DEBUG) : previousLevel(StructuredLogger::getInstance().getLogLevel()) {
        StructuredLogger::getInstance().setLogLevel(level);
        StructuredLogger::getInstance().addSink(sink);
    }

    ~Capture() {
        StructuredLogger::getInstance().removeSink(sink);
        StructuredLogger::getInstance().setLogLevel(previousLevel);
    }
};

LogEntry sampleEntry() {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = LogLevel::ERROR_LEVEL;
    entry.message = "Export not detected";
    entry.run_id = "RUN-20260219143005-0123abcd";
    entry.file = "/src/automation/export_watcher.cpp";
    entry.line = 42;
    entry.context["pattern"] = "brs_*.XLSX";
    return entry;
}

} // anonymous namespace

void testLevelFiltering() {
    Capture capture(LogLevel::WARNING);

    SLOG_DEBUG().message("debug");
    SLOG_INFO().message("info");
    SLOG_WARNING().message("warning");
    SLOG_ERROR().message("error");

    expectEqual(capture.sink->entries.size(), size_t(2), "entries below WARNING dropped");
    expectEqual(capture.sink->entries[0].message, std::string("warning"), "first kept entry");
    expect(capture.sink->entries[1].level == LogLevel::ERROR_LEVEL, "error level kept");
}

void testContextAndSourceLocation() {
    Capture capture;

    SLOG_INFO().message("Export detected").context("path", "C:/exports/a.XLSX").context("elapsed_ms", 1500);

    expectEqual(capture.sink->entries.size(), size_t(1), "one entry");
    const LogEntry& entry = capture.sink->entries[0];
    expectEqual(entry.context["path"].get<std::string>(), std::string("C:/exports/a.XLSX"), "string context");
    expectEqual(entry.context["elapsed_ms"].get<int>(), 1500, "numeric context");
    expect(entry.file.find("test_structured_logger") != std::string::npos, "source file recorded");
    expect(entry.line > 0, "source line recorded");
}

void testRunIdScope() {
    Capture capture;

    {
        ScopedRunId outer("RUN-A");
        SLOG_INFO().message("outer");
        {
            ScopedRunId inner("RUN-B");
            SLOG_INFO().message("inner");
        }
        SLOG_INFO().message("outer again");
    }
    SLOG_INFO().message("after");

    expectEqual(capture.sink->entries.size(), size_t(4), "four entries");
    expectEqual(capture.sink->entries[0].run_id, std::string("RUN-A"), "outer id");
    expectEqual(capture.sink->entries[1].run_id, std::string("RUN-B"), "inner id");
    expectEqual(capture.sink->entries[2].run_id, std::string("RUN-A"), "outer id restored");
    expectEqual(capture.sink->entries[3].run_id, std::string(""), "no id outside a run");
}

void testJsonFormatter() {
    JsonLogFormatter formatter;
    std::string line = formatter.format(sampleEntry());

    expect(!line.empty() && line.back() == '\n', "one line per entry");
    nlohmann::json parsed = nlohmann::json::parse(line);
    expectEqual(parsed["level"].get<std::string>(), std::string("ERROR"), "level");
    expectEqual(parsed["message"].get<std::string>(), std::string("Export not detected"), "message");
    expectEqual(parsed["run_id"].get<std::string>(), std::string("RUN-20260219143005-0123abcd"), "run id");
    expectEqual(parsed["source"]["file"].get<std::string>(), std::string("export_watcher.cpp"), "file name only");
    expectEqual(parsed["source"]["line"].get<int>(), 42, "line");
    expectEqual(parsed["context"]["pattern"].get<std::string>(), std::string("brs_*.XLSX"), "context");
    expect(!parsed.contains("operation"), "no operation fields for plain entries");
}

void testTextFormatter() {
    TextLogFormatter formatter;
    std::string line = formatter.format(sampleEntry());

    expect(line.find("[   ERROR]") != std::string::npos, "padded level");
    expect(line.find("[RUN-20260219143005-0123abcd]") != std::string::npos, "run id");
    expect(line.find("Export not detected (export_watcher.cpp:42)") != std::string::npos, "location for errors");
    expect(line.find("\"pattern\":\"brs_*.XLSX\"") != std::string::npos, "context as JSON");

    LogEntry info = sampleEntry();
    info.level = LogLevel::INFO;
    expect(formatter.format(info).find("export_watcher.cpp") == std::string::npos, "no location below ERROR");
}

void testScopedTimer() {
    Capture capture;

    {
        ScopedTimer timer("export_run", LogLevel::INFO);
    }
    {
        ScopedTimer cancelled("navigation_reset", LogLevel::INFO);
        cancelled.cancel();
    }

    expectEqual(capture.sink->entries.size(), size_t(1), "cancelled timer logs nothing");
    const LogEntry& entry = capture.sink->entries[0];
    expectEqual(entry.operation_name, std::string("export_run"), "operation name");
    expect(entry.level == LogLevel::INFO, "requested level");
    expect(entry.duration.count() >= 0, "duration measured");
}

void testSlowOperationEscalates() {
    Capture capture(LogLevel::WARNING);
    StructuredLogger::getInstance().setSlowOperationThreshold(std::chrono::milliseconds(-1));

    StructuredLogger::getInstance().logOperation("AWAIT_EXPORT", std::chrono::milliseconds(5), LogLevel::DEBUG);
    StructuredLogger::getInstance().setSlowOperationThreshold(std::chrono::seconds(30));
    StructuredLogger::getInstance().logOperation("AWAIT_EXPORT", std::chrono::milliseconds(5), LogLevel::DEBUG);

    expectEqual(capture.sink->entries.size(), size_t(1), "fast DEBUG operation filtered");
    expect(capture.sink->entries[0].level == LogLevel::WARNING, "slow operation logged as warning");
    expectEqual(capture.sink->entries[0].message, std::string("Slow operation detected"), "slow message");
}

void testRotatingFileSink() {
    TempDirectory temp;
    RotatingFileLogSink::Config config;
    config.base_path = temp.file("logs/exportflow.log");
    config.max_file_size = 256;
    config.max_files = 2;

    {
        RotatingFileLogSink sink(config, std::make_shared<JsonLogFormatter>());
        for (int i = 0; i < 40; ++i) {
            LogEntry entry = sampleEntry();
            entry.context["iteration"] = i;
            sink.write(entry);
        }
        sink.flush();
    }

    expect(std::filesystem::exists(config.base_path), "active file present");
    expect(std::filesystem::exists(temp.file("logs/exportflow.1.log")), "first rotation");
    expect(std::filesystem::exists(temp.file("logs/exportflow.2.log")), "second rotation");
    expect(!std::filesystem::exists(temp.file("logs/exportflow.3.log")), "older files removed");
}

void testLevelNames() {
    expect(logLevelFromString("debug") == LogLevel::DEBUG, "lowercase debug");
    expect(logLevelFromString("WARN") == LogLevel::WARNING, "short warning");
    expect(logLevelFromString("Error") == LogLevel::ERROR_LEVEL, "mixed case error");
    expect(logLevelFromString("CRITICAL") == LogLevel::CRITICAL, "critical");
    expect(logLevelFromString("verbose") == LogLevel::INFO, "unknown names fall back to INFO");
    expectEqual(logLevelToString(LogLevel::ERROR_LEVEL), std::string("ERROR"), "error name");
}

int main() {
    return runTests("StructuredLogger", {
        {"level filtering", testLevelFiltering},
        {"context and source location", testContextAndSourceLocation},
        {"run id scope", testRunIdScope},
        {"json formatter", testJsonFormatter},
        {"text formatter", testTextFormatter},
        {"scoped timer", testScopedTimer},
        {"slow operation escalates", testSlowOperationEscalates},
        {"rotating file sink", testRotatingFileSink},
        {"level names", testLevelNames}
    });
}
