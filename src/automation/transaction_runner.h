#ifndef EXPORTFLOW_TRANSACTION_RUNNER_H
#define EXPORTFLOW_TRANSACTION_RUNNER_H

#include <string>
#include <vector>
#include <memory>
#include "export_watcher.h"
#include "export_dialog.h"
#include "../scripting/session_facade.h"
#include "../common/clock.h"
#include "../common/config_manager.h"
#include "../common/structured_logger.h"
#include "../common/types.h"

namespace exportflow {
namespace automation {

enum class TransactionState {
    IDLE,
    ENTER_TRANSACTION,
    FILL_FIELDS,
    EXECUTE,
    OPEN_EXPORT_DIALOG,
    CONFIRM_SAVE,
    AWAIT_EXPORT,
    DONE,
    FAILED
};

std::string transactionStateToString(TransactionState state);

/**
 * @brief Shared shape of the two exporting transactions
 *
 * Subclasses walk ENTER_TRANSACTION -> FILL_FIELDS -> EXECUTE ->
 * OPEN_EXPORT_DIALOG -> CONFIRM_SAVE -> AWAIT_EXPORT -> DONE. Any exception
 * moves the runner to FAILED and is rethrown unchanged. Each state is timed
 * and logged.
 */
class TransactionRunner {
public:
    virtual ~TransactionRunner();

    TransactionRunner(const TransactionRunner&) = delete;
    TransactionRunner& operator=(const TransactionRunner&) = delete;

    const std::string& name() const { return m_name; }
    TransactionState state() const { return m_state; }
    const std::vector<TransactionState>& history() const { return m_history; }

protected:
    TransactionRunner(std::string name, IClock& clock, const ExportSettings& exports);

    void transition(TransactionState next);
    void fail();
    void enterTransaction(scripting::ISessionFacade& session, const std::string& code);

    IClock& m_clock;
    ExportSettings m_exports;
    ExportWatcher m_watcher;

private:
    std::string m_name;
    TransactionState m_state;
    std::vector<TransactionState> m_history;
    std::unique_ptr<ScopedTimer> m_stateTimer;
};

/**
 * @brief Report that lists the records of a period and exports them to directory A
 *
 * When the primary pattern times out, one scan with the fallback pattern is
 * made for files that changed since the baseline and are no older than one
 * second before the save was confirmed.
 */
class RecordSourceTransaction : public TransactionRunner {
public:
    RecordSourceTransaction(IClock& clock, const TransactionSettings& transactions, const ExportSettings& exports);

    // Absolute path of the exported artifact
    std::string run(scripting::ISessionFacade& session, const RunCommand& command);

private:
    void fillFields(scripting::ISessionFacade& session, const RunCommand& command);

    TransactionSettings m_transactions;
};

/**
 * @brief Report fed with the identifiers on the clipboard, exported to directory B
 *
 * Expects the clipboard to hold the payload before run() is called. The
 * exported artifact is copied once more under a timestamped audit name.
 */
class BulkLookupTransaction : public TransactionRunner {
public:
    struct Result {
        std::string exportPath;
        std::string auditCopyPath;
    };

    BulkLookupTransaction(IClock& clock, const TransactionSettings& transactions, const ExportSettings& exports);

    Result run(scripting::ISessionFacade& session, size_t recordCount);

    // <prefix>YYYYMMDD_HHMMSS<extension of source, .xlsx when none>
    static std::string auditCopyName(const std::string& prefix, const std::string& sourcePath,
                                     std::chrono::system_clock::time_point when);

private:
    std::string makeAuditCopy(const std::string& exportPath);

    TransactionSettings m_transactions;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_TRANSACTION_RUNNER_H
