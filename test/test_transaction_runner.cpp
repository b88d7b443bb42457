#include "test_support.h"
#include "automation/transaction_runner.h"
#include "automation/navigation_reset.h"
#include "automation/export_dialog.h"
#include "automation/control_ids.h"
#include "common/file_utils.h"
#include "common/os_utils.h"
#include "common/string_utils.h"
#include "ocal/filesystem_operations.h"
#include <ctime>

using namespace exportflow;
using namespace exportflow::testing;
using namespace exportflow::automation;

namespace {

struct Fixture {
    TempDirectory temp;
    ManualClock clock;
    FakeSession session;
    TransactionSettings transactions;
    ExportSettings exports;

    Fixture() {
        exports.directoryA = temp.subdirectory("a");
        exports.directoryB = temp.subdirectory("b");
        exports.timeout = std::chrono::seconds(5);
        exports.pollInterval = std::chrono::milliseconds(500);
        session.addControls({controls::kExportPathField, controls::kExportSaveButton});
    }

    // The application writes the file when the save button is pressed
    void exportOnSave(const std::string& path, const std::string& content = "data") {
        session.hooks[controls::kExportSaveButton] = [path, content]() { writeFile(path, content); };
    }
};

RunCommand period() {
    return RunCommand(CalendarDate(2026, 1, 19), CalendarDate(2026, 2, 19));
}

std::string act(const std::string& verb, const std::string& id, const std::string& value = "") {
    return value.empty() ? verb + ":" + id : verb + ":" + id + "=" + value;
}

void expectBefore(const FakeSession& session, const std::string& first, const std::string& second) {
    int a = session.indexOf(first);
    int b = session.indexOf(second);
    expect(a >= 0, "performed: " + first);
    expect(b >= 0, "performed: " + second);
    expect(a < b, first + " before " + second);
}

} // anonymous namespace

void testRecordSourceHappyPath() {
    Fixture f;
    writeFile(f.temp.file("a/export_old.XLSX"), "old");
    f.exportOnSave(f.temp.file("a/export_20260219.XLSX"));

    RecordSourceTransaction transaction(f.clock, f.transactions, f.exports);
    std::string path = transaction.run(f.session, period());

    expectEqual(path, ocal::filesystem::getAbsolutePath(f.temp.file("a/export_20260219.XLSX")), "new export returned");
    expect(transaction.state() == TransactionState::DONE, "state DONE");

    std::vector<std::string> expected = {
        act("maximize", controls::kMainWindow),
        act("setText", controls::kCommandField, "zucrm_039"),
        act("sendVKey", controls::kMainWindow, "0"),
        act("setText", controls::kCategoryField, "ov"),
        act("setText", controls::kDateFromField, "19.01.2026"),
        act("setText", controls::kDateToField, "19.02.2026"),
        act("setText", controls::kCodeFilterField, "*"),
        act("setText", controls::kVariantField, "/abap ov2"),
        act("setFocus", controls::kVariantField),
        act("setCaret", controls::kVariantField, "9"),
        act("press", controls::kExecuteButton),
        act("select", controls::kRecordSourceExportMenu),
        act("setText", controls::kExportPathField,
            os::PathUtils::toWindowsPath(ocal::filesystem::getAbsolutePath(f.exports.directoryA))),
        act("press", controls::kExportSaveButton)
    };
    expectEqual(f.session.actions.size(), expected.size(), "action count");
    for (size_t i = 0; i < expected.size(); ++i) {
        expectEqual(f.session.actions[i], expected[i], "action " + std::to_string(i));
    }
}

void testRecordSourceStateHistory() {
    Fixture f;
    f.exportOnSave(f.temp.file("a/export.XLSX"));

    RecordSourceTransaction transaction(f.clock, f.transactions, f.exports);
    transaction.run(f.session, period());

    std::vector<TransactionState> expected = {
        TransactionState::ENTER_TRANSACTION, TransactionState::FILL_FIELDS, TransactionState::EXECUTE,
        TransactionState::OPEN_EXPORT_DIALOG, TransactionState::CONFIRM_SAVE, TransactionState::AWAIT_EXPORT,
        TransactionState::DONE
    };
    expect(transaction.history() == expected, "states visited in order");
    expectEqual(transactionStateToString(TransactionState::AWAIT_EXPORT), std::string("AWAIT_EXPORT"), "state name");
}

void testRecordSourceFallbackPattern() {
    Fixture f;
    f.exportOnSave(f.temp.file("a/Lista 2026.XLSX"));

    RecordSourceTransaction transaction(f.clock, f.transactions, f.exports);
    std::string path = transaction.run(f.session, period());

    expectEqual(path, ocal::filesystem::getAbsolutePath(f.temp.file("a/Lista 2026.XLSX")), "fallback match returned");
    expect(f.clock.totalSlept() >= f.exports.timeout, "primary pattern waited for the full timeout");
    expect(transaction.state() == TransactionState::DONE, "state DONE");
}

void testRecordSourceTimeout() {
    Fixture f;
    writeFile(f.temp.file("a/export_old.XLSX"), "old");

    RecordSourceTransaction transaction(f.clock, f.transactions, f.exports);
    auto error = expectThrows<ExportTimeoutError>([&]() { transaction.run(f.session, period()); }, "no export");

    expectEqual(error.pattern(), f.exports.patternA, "primary pattern reported");
    expectEqual(error.directory(), f.exports.directoryA, "directory reported");
    expect(transaction.state() == TransactionState::FAILED, "state FAILED");
    expect(transaction.history().size() >= 2 &&
           transaction.history()[transaction.history().size() - 2] == TransactionState::AWAIT_EXPORT,
           "failed while awaiting the export");
}

void testRecordSourceControlFailure() {
    Fixture f;
    f.session.broken.insert(controls::kExecuteButton);

    RecordSourceTransaction transaction(f.clock, f.transactions, f.exports);
    auto error = expectThrows<ControlResolutionError>([&]() { transaction.run(f.session, period()); }, "broken");

    expectEqual(error.controlId(), std::string(controls::kExecuteButton), "control named");
    expect(transaction.state() == TransactionState::FAILED, "state FAILED");
    expect(f.session.indexOf(act("select", controls::kRecordSourceExportMenu)) < 0, "export menu not reached");
}

void testBulkLookupFlowAndAuditCopy() {
    Fixture f;
    f.session.addControls({controls::kMultiSelectButton});
    f.exportOnSave(f.temp.file("b/brs_20260219.XLSX"), "lookup");

    BulkLookupTransaction transaction(f.clock, f.transactions, f.exports);
    BulkLookupTransaction::Result result = transaction.run(f.session, 3);

    expectEqual(result.exportPath, ocal::filesystem::getAbsolutePath(f.temp.file("b/brs_20260219.XLSX")), "export");
    expect(utils::FileUtils::fileExists(result.auditCopyPath), "audit copy written");
    expectEqual(os::PathUtils::getExtension(result.auditCopyPath), std::string(".XLSX"), "source extension kept");
    expect(utils::StringUtils::startsWith(os::PathUtils::getFileName(result.auditCopyPath), "full_copy_"), "prefix");
    expectEqual(ocal::filesystem::getAbsolutePath(std::filesystem::path(result.auditCopyPath).parent_path().string()),
                ocal::filesystem::getAbsolutePath(f.exports.directoryB), "copy lives in directory B");

    std::string copied;
    expect(utils::FileUtils::readFileToString(result.auditCopyPath, copied), "copy readable");
    expectEqual(copied, std::string("lookup"), "copy content");

    expect(f.session.performed(act("setText", controls::kCommandField, "iw59")), "transaction entered");
    expectBefore(f.session, act("press", controls::kMultiSelectButton), act("press", controls::kDialogPasteButton));
    expectBefore(f.session, act("press", controls::kDialogPasteButton), act("press", controls::kDialogExecuteButton));
    expectBefore(f.session, act("press", controls::kDialogExecuteButton), act("press", controls::kExecuteButton));
    expectBefore(f.session, act("press", controls::kExecuteButton), act("select", controls::kBulkLookupExportMenu));
    expectBefore(f.session, act("select", controls::kBulkLookupExportMenu), act("select", controls::kSpreadsheetFormatOption));
    expectBefore(f.session, act("setFocus", controls::kSpreadsheetFormatOption), act("press", controls::kExportSaveButton));
    expectEqual(f.session.pressCount[controls::kDialogOkButton], 2, "menu and format popups confirmed");
    expect(transaction.state() == TransactionState::DONE, "state DONE");
}

void testBulkLookupWaitsForMultiSelect() {
    Fixture f;
    f.clock.schedule(std::chrono::milliseconds(900), [&]() { f.session.addControls({controls::kMultiSelectButton}); });
    f.exportOnSave(f.temp.file("b/brs_1.XLSX"));

    BulkLookupTransaction transaction(f.clock, f.transactions, f.exports);
    transaction.run(f.session, 1);

    expect(f.clock.totalSlept() >= std::chrono::milliseconds(900), "waited for the button");
    expect(f.clock.totalSlept() < f.transactions.controlWaitTimeout, "stopped waiting once it appeared");
}

void testBulkLookupMissingMultiSelect() {
    Fixture f;

    BulkLookupTransaction transaction(f.clock, f.transactions, f.exports);
    auto error = expectThrows<ControlResolutionError>([&]() { transaction.run(f.session, 1); }, "button absent");

    expectEqual(error.controlId(), std::string(controls::kMultiSelectButton), "control named");
    expect(f.clock.totalSlept() >= f.transactions.controlWaitTimeout, "waited for the control timeout");
    expect(!f.session.performed(act("press", controls::kDialogPasteButton)), "nothing pasted");
    expect(transaction.state() == TransactionState::FAILED, "state FAILED");
}

void testBulkLookupTimeoutHasNoFallback() {
    Fixture f;
    f.session.addControls({controls::kMultiSelectButton});
    f.exportOnSave(f.temp.file("b/other.XLSX"));

    BulkLookupTransaction transaction(f.clock, f.transactions, f.exports);
    auto error = expectThrows<ExportTimeoutError>([&]() { transaction.run(f.session, 2); }, "wrong name");
    expectEqual(error.pattern(), f.exports.patternB, "pattern reported");
}

void testAuditCopyName() {
    std::tm local{};
    local.tm_year = 2026 - 1900;
    local.tm_mon = 1;
    local.tm_mday = 19;
    local.tm_hour = 14;
    local.tm_min = 30;
    local.tm_sec = 5;
    local.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    expectEqual(BulkLookupTransaction::auditCopyName("full_copy_", "C:/exports/brs_1.XLSX", when),
                std::string("full_copy_20260219_143005.XLSX"), "timestamped name");
    expectEqual(BulkLookupTransaction::auditCopyName("copy_", "brs_1", when),
                std::string("copy_20260219_143005.xlsx"), "default extension");
}

void testExportDialogConfirmsIntermediatePopup() {
    TempDirectory temp;
    ManualClock clock;
    FakeSession session;
    session.addControls({controls::kDialogOkButton, controls::kOverwriteConfirmButton});
    session.hooks[controls::kDialogOkButton] = [&]() {
        session.present.erase(controls::kDialogOkButton);
        session.addControls({controls::kExportPathField, controls::kExportSaveButton});
    };

    std::string directory = temp.file("nested/out");
    ExportDialog(session, clock).save(directory);

    expect(ocal::filesystem::directoryExists(directory), "directory created");
    expectEqual(session.pressCount[controls::kDialogOkButton], 1, "popup confirmed once");
    expectEqual(clock.totalSlept().count(), 200LL, "settle delay after popup");
    expectBefore(session, act("press", controls::kDialogOkButton), act("press", controls::kExportSaveButton));
    expect(session.performed(act("press", controls::kOverwriteConfirmButton)), "overwrite accepted");
}

void testExportDialogOkWithoutSaveButton() {
    TempDirectory temp;
    ManualClock clock;
    FakeSession session;
    session.addControls({controls::kDialogOkButton, controls::kExportPathField});

    auto before = std::filesystem::file_time_type::clock::now();
    auto started = ExportDialog(session, clock).save(temp.path());

    expect(started >= before, "start time taken during the call");
    expectEqual(session.pressCount[controls::kDialogOkButton], 1, "OK used as save");
    expect(!session.performed(act("press", controls::kOverwriteConfirmButton)), "no overwrite prompt");
}

void testExportDialogWithoutButtons() {
    TempDirectory temp;
    ManualClock clock;
    FakeSession session;

    auto error = expectThrows<ControlResolutionError>([&]() { ExportDialog(session, clock).save(temp.path()); },
                                                      "no buttons");
    expectEqual(error.controlId(), std::string(controls::kExportSaveButton), "save button named");
}

void testNavigationBounds() {
    ManualClock clock;
    NavigationSettings settings;

    settings.maxBackPresses = 10;
    expectEqual(NavigationReset(clock, settings).maxPresses(), 4, "upper bound");
    settings.maxBackPresses = 1;
    expectEqual(NavigationReset(clock, settings).maxPresses(), 3, "lower bound");
    settings.maxBackPresses = 4;
    expectEqual(NavigationReset(clock, settings).maxPresses(), 4, "configured value");
}

void testNavigationStopsAtCommandField() {
    ManualClock clock;
    FakeSession session;
    session.addControls({controls::kBackButton, controls::kCommandField});
    NavigationSettings settings;

    int presses = NavigationReset(clock, settings).run(session);
    expectEqual(presses, 3, "minimum presses");
    expectEqual(clock.totalSlept().count(), (settings.pressDelay * 3).count(), "delay after each press");
}

void testNavigationUsesUpperBound() {
    ManualClock clock;
    FakeSession session;
    session.addControls({controls::kBackButton});
    NavigationSettings settings;

    expectEqual(NavigationReset(clock, settings).run(session), 4, "command field never seen");
    settings.maxBackPresses = 3;
    expectEqual(NavigationReset(clock, settings).run(session), 3, "configured bound");
}

void testNavigationWithoutBackButton() {
    ManualClock clock;
    FakeSession session;
    session.addControls({controls::kBackButton});
    session.hooks[controls::kBackButton] = [&]() {
        if (session.pressCount[controls::kBackButton] == 2) {
            session.present.erase(controls::kBackButton);
        }
    };

    expectEqual(NavigationReset(clock, NavigationSettings()).run(session), 2, "stops when back disappears");

    FakeSession bare;
    expectEqual(NavigationReset(clock, NavigationSettings()).run(bare), 0, "no back button at all");
}

int main() {
    return runTests("TransactionRunner", {
        {"record source happy path", testRecordSourceHappyPath},
        {"record source state history", testRecordSourceStateHistory},
        {"record source fallback pattern", testRecordSourceFallbackPattern},
        {"record source timeout", testRecordSourceTimeout},
        {"record source control failure", testRecordSourceControlFailure},
        {"bulk lookup flow and audit copy", testBulkLookupFlowAndAuditCopy},
        {"bulk lookup waits for multi-select", testBulkLookupWaitsForMultiSelect},
        {"bulk lookup missing multi-select", testBulkLookupMissingMultiSelect},
        {"bulk lookup timeout has no fallback", testBulkLookupTimeoutHasNoFallback},
        {"audit copy name", testAuditCopyName},
        {"export dialog confirms intermediate popup", testExportDialogConfirmsIntermediatePopup},
        {"export dialog OK without save button", testExportDialogOkWithoutSaveButton},
        {"export dialog without buttons", testExportDialogWithoutButtons},
        {"navigation bounds", testNavigationBounds},
        {"navigation stops at command field", testNavigationStopsAtCommandField},
        {"navigation uses upper bound", testNavigationUsesUpperBound},
        {"navigation without back button", testNavigationWithoutBackButton}
    });
}
