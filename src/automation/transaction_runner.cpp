#include "transaction_runner.h"
#include "control_ids.h"
#include "../common/error_handler.h"
#include "../common/os_utils.h"
#include "../ocal/filesystem_operations.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace exportflow {
namespace automation {

using scripting::ISessionFacade;

std::string transactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::IDLE: return "IDLE";
        case TransactionState::ENTER_TRANSACTION: return "ENTER_TRANSACTION";
        case TransactionState::FILL_FIELDS: return "FILL_FIELDS";
        case TransactionState::EXECUTE: return "EXECUTE";
        case TransactionState::OPEN_EXPORT_DIALOG: return "OPEN_EXPORT_DIALOG";
        case TransactionState::CONFIRM_SAVE: return "CONFIRM_SAVE";
        case TransactionState::AWAIT_EXPORT: return "AWAIT_EXPORT";
        case TransactionState::DONE: return "DONE";
        case TransactionState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

// TransactionRunner

TransactionRunner::TransactionRunner(std::string name, IClock& clock, const ExportSettings& exports)
    : m_clock(clock), m_exports(exports), m_watcher(clock, exports.pollInterval),
      m_name(std::move(name)), m_state(TransactionState::IDLE) {}

TransactionRunner::~TransactionRunner() = default;

void TransactionRunner::transition(TransactionState next) {
    // Closing the previous timer logs how long the previous state took
    m_stateTimer.reset();

    SLOG_DEBUG().message("Transaction state changed")
        .context("transaction", m_name)
        .context("from", transactionStateToString(m_state))
        .context("to", transactionStateToString(next));

    m_state = next;
    m_history.push_back(next);

    if (next != TransactionState::DONE && next != TransactionState::FAILED) {
        m_stateTimer = std::make_unique<ScopedTimer>(m_name + "." + transactionStateToString(next), LogLevel::INFO);
    }
}

void TransactionRunner::fail() {
    SLOG_ERROR().message("Transaction failed")
        .context("transaction", m_name)
        .context("state", transactionStateToString(m_state));
    transition(TransactionState::FAILED);
}

void TransactionRunner::enterTransaction(ISessionFacade& session, const std::string& code) {
    transition(TransactionState::ENTER_TRANSACTION);
    session.maximize(controls::kMainWindow);
    session.setText(controls::kCommandField, code);
    session.sendVKey(controls::kMainWindow, controls::kEnterKey);
}

// RecordSourceTransaction

RecordSourceTransaction::RecordSourceTransaction(IClock& clock, const TransactionSettings& transactions,
                                                 const ExportSettings& exports)
    : TransactionRunner(transactions.codeA, clock, exports), m_transactions(transactions) {}

void RecordSourceTransaction::fillFields(ISessionFacade& session, const RunCommand& command) {
    session.setText(controls::kCategoryField, m_transactions.categoryMarker);
    session.setText(controls::kDateFromField, command.startDate.toFieldFormat());
    session.setText(controls::kDateToField, command.endDate.toFieldFormat());
    session.setText(controls::kCodeFilterField, m_transactions.wildcardFilter);
    session.setText(controls::kVariantField, m_transactions.reportVariant);
    session.setFocus(controls::kVariantField);
    session.setCaretPosition(controls::kVariantField,
                             static_cast<int>(std::min<size_t>(9, m_transactions.reportVariant.size())));
}

std::string RecordSourceTransaction::run(ISessionFacade& session, const RunCommand& command) {
    SLOG_INFO().message("Running transaction")
        .context("transaction", m_transactions.codeA)
        .context("start_date", command.startDate.toIso())
        .context("end_date", command.endDate.toIso());

    try {
        const std::string& directory = m_exports.directoryA;
        DirectorySnapshot baseline = m_watcher.snapshot(directory);

        enterTransaction(session, m_transactions.codeA);

        transition(TransactionState::FILL_FIELDS);
        fillFields(session, command);

        transition(TransactionState::EXECUTE);
        session.press(controls::kExecuteButton);

        transition(TransactionState::OPEN_EXPORT_DIALOG);
        session.select(controls::kRecordSourceExportMenu);

        transition(TransactionState::CONFIRM_SAVE);
        auto saved = ExportDialog(session, m_clock).save(directory);

        transition(TransactionState::AWAIT_EXPORT);
        std::string exported;
        try {
            exported = m_watcher.awaitExport(directory, baseline, m_exports.patternA, m_exports.timeout);
        } catch (const ExportTimeoutError&) {
            auto fallback = m_watcher.findChanged(directory, baseline, m_exports.fallbackPatternA,
                                                  saved - std::chrono::seconds(1));
            if (!fallback) {
                throw;
            }
            SLOG_WARNING().message("Export not matched by primary pattern, using fallback")
                .context("pattern", m_exports.patternA)
                .context("fallback_pattern", m_exports.fallbackPatternA)
                .context("path", *fallback);
            exported = *fallback;
        }

        transition(TransactionState::DONE);
        SLOG_INFO().message("Transaction export ready").context("transaction", m_transactions.codeA).context("path", exported);
        return exported;
    } catch (const std::exception&) {
        fail();
        throw;
    }
}

// BulkLookupTransaction

BulkLookupTransaction::BulkLookupTransaction(IClock& clock, const TransactionSettings& transactions,
                                             const ExportSettings& exports)
    : TransactionRunner(transactions.codeB, clock, exports), m_transactions(transactions) {}

std::string BulkLookupTransaction::auditCopyName(const std::string& prefix, const std::string& sourcePath,
                                                 std::chrono::system_clock::time_point when) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::string extension = os::PathUtils::getExtension(sourcePath);
    if (extension.empty()) {
        extension = ".xlsx";
    }

    std::ostringstream name;
    name << prefix << std::put_time(&local, "%Y%m%d_%H%M%S") << extension;
    return name.str();
}

std::string BulkLookupTransaction::makeAuditCopy(const std::string& exportPath) {
    std::string target = ocal::filesystem::getAbsolutePath(os::PathUtils::join(
        m_exports.directoryB, auditCopyName(m_exports.auditCopyPrefix, exportPath, std::chrono::system_clock::now())));

    if (!ocal::filesystem::copyFile(exportPath, target, true, true)) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Audit copy could not be written",
                              exportPath + " -> " + target);
    }
    return target;
}

BulkLookupTransaction::Result BulkLookupTransaction::run(ISessionFacade& session, size_t recordCount) {
    SLOG_INFO().message("Running transaction")
        .context("transaction", m_transactions.codeB)
        .context("records", recordCount);

    try {
        const std::string& directory = m_exports.directoryB;
        DirectorySnapshot baseline = m_watcher.snapshot(directory);

        enterTransaction(session, m_transactions.codeB);

        transition(TransactionState::FILL_FIELDS);
        scripting::waitForControl(session, controls::kMultiSelectButton, m_clock, m_transactions.controlWaitTimeout);
        session.press(controls::kMultiSelectButton);
        session.press(controls::kDialogPasteButton);
        session.press(controls::kDialogExecuteButton);

        transition(TransactionState::EXECUTE);
        session.press(controls::kExecuteButton);

        transition(TransactionState::OPEN_EXPORT_DIALOG);
        session.select(controls::kBulkLookupExportMenu);
        session.press(controls::kDialogOkButton);
        session.select(controls::kSpreadsheetFormatOption);
        session.setFocus(controls::kSpreadsheetFormatOption);
        session.press(controls::kDialogOkButton);

        transition(TransactionState::CONFIRM_SAVE);
        ExportDialog(session, m_clock).save(directory);

        transition(TransactionState::AWAIT_EXPORT);
        Result result;
        result.exportPath = m_watcher.awaitExport(directory, baseline, m_exports.patternB, m_exports.timeout);
        result.auditCopyPath = makeAuditCopy(result.exportPath);

        transition(TransactionState::DONE);
        SLOG_INFO().message("Transaction export ready")
            .context("transaction", m_transactions.codeB)
            .context("path", result.exportPath)
            .context("audit_copy", result.auditCopyPath);
        return result;
    } catch (const std::exception&) {
        fail();
        throw;
    }
}

} // namespace automation
} // namespace exportflow
