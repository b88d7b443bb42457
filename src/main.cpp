#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"
#include "common/clock.h"
#include "common/types.h"
#include "orchestrator/orchestrator.h"
#include "scripting/scripting_engine.h"
#include "ocal/ui_automation.h"
#include "ocal/clipboard.h"

using namespace exportflow;

namespace {

const char* kVersion = "1.0.0";

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInvalidArguments = 2;

struct CommandLine {
    std::string startDate;
    std::string endDate;
    std::string configPath = "config/exportflow.json";
    std::string logLevel;
    bool showHelp = false;
    bool showVersion = false;
};

void printUsage() {
    std::cout << "exportflow - two-step export automation\n";
    std::cout << "Usage: exportflow --start YYYY-MM-DD --end YYYY-MM-DD [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --start <date>       First day of the reporting period\n";
    std::cout << "  --end <date>         Last day of the reporting period\n";
    std::cout << "  --config <path>      Configuration file (default config/exportflow.json)\n";
    std::cout << "  --log-level <level>  DEBUG, INFO, WARNING, ERROR or CRITICAL\n";
    std::cout << "  --help, -h           Show this help message\n";
    std::cout << "  --version, -v        Show version information\n";
}

CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine options;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](const std::string& field) -> std::string {
            if (i + 1 >= args.size()) {
                throw ValidationError(field, arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--version" || arg == "-v") {
            options.showVersion = true;
        } else if (arg == "--start") {
            options.startDate = value("start_date");
        } else if (arg == "--end") {
            options.endDate = value("end_date");
        } else if (arg == "--config") {
            options.configPath = value("config");
        } else if (arg == "--log-level") {
            options.logLevel = value("log_level");
        } else {
            throw ValidationError("arguments", "unknown option '" + arg + "'");
        }
    }
    return options;
}

RunCommand buildRunCommand(const CommandLine& options) {
    if (options.startDate.empty()) {
        throw ValidationError("start_date", "--start is required");
    }
    if (options.endDate.empty()) {
        throw ValidationError("end_date", "--end is required");
    }
    RunCommand command(CalendarDate::parseIso(options.startDate, "start_date"),
                       CalendarDate::parseIso(options.endDate, "end_date"));
    command.validate();
    return command;
}

void configureLogging(const ConfigManager& config, const std::string& levelOverride) {
    auto& slogger = StructuredLogger::getInstance();
    slogger.setLogLevel(logLevelFromString(levelOverride.empty() ? config.getLogLevel() : levelOverride));

    std::string logFile = config.getLogFile();
    if (logFile.empty()) {
        return;
    }

    RotatingFileLogSink::Config fileConfig;
    fileConfig.base_path = logFile;
    fileConfig.max_file_size = static_cast<size_t>(config.getLogMaxSizeMb()) * 1024 * 1024;
    fileConfig.max_files = static_cast<size_t>(config.getLogMaxFiles());

    std::shared_ptr<ILogFormatter> formatter;
    if (config.getLogFormat() == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }
    slogger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, formatter));

    SLOG_DEBUG().message("Structured logging configured")
        .context("log_file", logFile)
        .context("format", config.getLogFormat());
}

void printError(const AutomationError& error) {
    std::cerr << error.toJson().dump(2) << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine options;
    RunCommand command;
    try {
        options = parseArguments(argc, argv);
        if (options.showHelp) {
            printUsage();
            return kExitSuccess;
        }
        if (options.showVersion) {
            std::cout << "exportflow " << kVersion << std::endl;
            return kExitSuccess;
        }
        command = buildRunCommand(options);
    } catch (const ValidationError& e) {
        printError(e);
        return kExitInvalidArguments;
    }

    try {
        ConfigManager& config = ConfigManager::getInstance();
        if (!config.loadConfig(options.configPath)) {
            throw AutomationError(ErrorType::CONFIGURATION, "Configuration could not be loaded", options.configPath);
        }
        configureLogging(config, options.logLevel);

        AutomationSettings settings = config.getAutomationSettings();
        IClock& clock = SystemClock::getInstance();

        scripting::GuiScriptingEngine engine(settings.connection, clock);
        ocal::uia::DesktopUiTree uiTree;
        ocal::clipboard::SystemClipboard clipboard;

        Orchestrator orchestrator(settings, engine, uiTree, clipboard, clock);
        RunResult result = orchestrator.run(command);

        std::cout << result.toJson().dump(2) << std::endl;
        StructuredLogger::getInstance().flush();
        return kExitSuccess;
    } catch (const ValidationError& e) {
        printError(e);
        StructuredLogger::getInstance().flush();
        return kExitInvalidArguments;
    } catch (const AutomationError& e) {
        printError(e);
        StructuredLogger::getInstance().flush();
        return kExitFailure;
    } catch (const std::exception& e) {
        AutomationError wrapped(ErrorType::UNKNOWN, "Fatal error", e.what());
        ErrorHandler::getInstance().record(wrapped);
        printError(wrapped);
        StructuredLogger::getInstance().flush();
        return kExitFailure;
    }
}
