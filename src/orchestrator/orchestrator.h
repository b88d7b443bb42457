#ifndef EXPORTFLOW_ORCHESTRATOR_H
#define EXPORTFLOW_ORCHESTRATOR_H

#include <string>
#include <mutex>
#include <atomic>
#include "../common/types.h"
#include "../common/clock.h"
#include "../common/config_manager.h"
#include "../scripting/scripting_engine.h"
#include "../ocal/ui_automation.h"
#include "../ocal/clipboard.h"

namespace exportflow {

/**
 * @brief Runs the two-transaction export workflow end to end
 *
 * Sequence: validate -> connect -> record-source export -> read and
 * normalize identifiers -> navigation reset -> clipboard -> bulk-lookup
 * export. Either every step succeeds and a complete RunResult is returned,
 * or an AutomationError describing the first failure is thrown.
 *
 * At most one run is in flight per Orchestrator; a concurrent call waits
 * runLockTimeout and then fails with RUN_IN_PROGRESS.
 */
class Orchestrator {
public:
    Orchestrator(const AutomationSettings& settings,
                 scripting::IScriptingEngine& engine,
                 ocal::uia::IUiTree& uiTree,
                 ocal::clipboard::IClipboardWriter& clipboard,
                 IClock& clock);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    RunResult run(const RunCommand& command);

    bool isRunning() const { return m_running.load(); }

    static std::string generateRunId();

private:
    RunResult execute(const RunCommand& command, const std::string& runId);
    void requireCredentials() const;

    AutomationSettings m_settings;
    scripting::IScriptingEngine& m_engine;
    ocal::uia::IUiTree& m_uiTree;
    ocal::clipboard::IClipboardWriter& m_clipboard;
    IClock& m_clock;

    std::timed_mutex m_runMutex;
    std::atomic<bool> m_running;
};

} // namespace exportflow

#endif // EXPORTFLOW_ORCHESTRATOR_H
