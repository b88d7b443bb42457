#include "orchestrator.h"
#include "../automation/session_connector.h"
#include "../automation/transaction_runner.h"
#include "../automation/record_list_normalizer.h"
#include "../automation/navigation_reset.h"
#include "../automation/clipboard_injector.h"
#include "../spreadsheet/sheet_reader.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <filesystem>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace exportflow {

Orchestrator::Orchestrator(const AutomationSettings& settings,
                           scripting::IScriptingEngine& engine,
                           ocal::uia::IUiTree& uiTree,
                           ocal::clipboard::IClipboardWriter& clipboard,
                           IClock& clock)
    : m_settings(settings), m_engine(engine), m_uiTree(uiTree), m_clipboard(clipboard),
      m_clock(clock), m_running(false) {
    m_settings.validate();
}

std::string Orchestrator::generateRunId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char* hexChars = "0123456789abcdef";

    std::time_t time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::stringstream ss;
    ss << "RUN-" << std::put_time(&local, "%Y%m%d%H%M%S") << "-";
    for (int i = 0; i < 8; ++i) {
        ss << hexChars[dis(gen)];
    }
    return ss.str();
}

RunResult Orchestrator::run(const RunCommand& command) {
    std::unique_lock<std::timed_mutex> lock(m_runMutex, std::defer_lock);
    if (!lock.try_lock_for(m_settings.runLockTimeout)) {
        AutomationError busy(ErrorType::RUN_IN_PROGRESS, "Another run is in progress",
                             "waited " + std::to_string(m_settings.runLockTimeout.count()) + " ms");
        ErrorHandler::getInstance().record(busy);
        throw busy;
    }

    std::string runId = generateRunId();
    ScopedRunId scopedRunId(runId);
    m_running = true;

    struct RunningFlag {
        std::atomic<bool>& flag;
        ~RunningFlag() { flag = false; }
    } runningFlag{m_running};

    try {
        return execute(command, runId);
    } catch (const AutomationError& e) {
        ErrorHandler::getInstance().record(e);
        throw;
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::filesystem::filesystem_error& e) {
        AutomationError wrapped(ErrorType::PLATFORM, "Filesystem operation failed", e.what(), e.path1().string());
        ErrorHandler::getInstance().record(wrapped);
        throw wrapped;
    } catch (const std::exception& e) {
        AutomationError wrapped(ErrorType::UNKNOWN, "Unexpected failure during run", e.what());
        ErrorHandler::getInstance().record(wrapped);
        throw wrapped;
    }
}

void Orchestrator::requireCredentials() const {
    if (m_settings.credentials.username.empty() || m_settings.credentials.password.empty()) {
        throw AutomationError(ErrorType::CONFIGURATION, "Application credentials are not configured",
                              "set credentials.username and credentials.password or their environment variables");
    }
}

RunResult Orchestrator::execute(const RunCommand& command, const std::string& runId) {
    SCOPED_TIMER_LEVEL("export_run", LogLevel::INFO);
    SLOG_INFO().message("Run started")
        .context("start_date", command.startDate.toIso())
        .context("end_date", command.endDate.toIso());

    command.validate();
    requireCredentials();

    automation::SessionConnector connector(m_engine, m_uiTree, m_clock,
                                           m_settings.connection, m_settings.credentials);
    std::unique_ptr<scripting::ISessionFacade> session = connector.connect();

    automation::RecordSourceTransaction recordSource(m_clock, m_settings.transactions, m_settings.exports);
    std::string exportA = recordSource.run(*session, command);

    automation::RecordListNormalizer normalizer(m_settings.records.acceptedHeaders, m_settings.records.measureMarker);
    RecordIdList ids = normalizer.extract(spreadsheet::SheetReader::read(exportA));

    automation::NavigationReset navigation(m_clock, m_settings.navigation);
    navigation.run(*session);

    automation::ClipboardInjector injector(m_clipboard);
    injector.write(ids);

    automation::BulkLookupTransaction bulkLookup(m_clock, m_settings.transactions, m_settings.exports);
    automation::BulkLookupTransaction::Result exportB = bulkLookup.run(*session, ids.size());

    RunResult result;
    result.exportPathA = exportA;
    result.exportPathB = exportB.exportPath;
    result.auditCopyPath = exportB.auditCopyPath;
    result.recordCount = ids.size();
    result.runId = runId;

    SLOG_INFO().message("Run finished")
        .context("export_path_a", result.exportPathA)
        .context("export_path_b", result.exportPathB)
        .context("record_count", result.recordCount);
    return result;
}

} // namespace exportflow
