#include "test_support.h"
#include "orchestrator/orchestrator.h"
#include "automation/control_ids.h"
#include "common/file_utils.h"
#include "common/string_utils.h"
#include "ocal/filesystem_operations.h"
#include "workbook_builder.h"
#include <future>
#include <thread>

using namespace exportflow;
using namespace exportflow::testing;

namespace {

const std::string kRecordExport = "No Nota/Medida;Status\n000123;OPEN\n7/000;OPEN\n456;OPEN\n123;CLOSED\n";

struct Fixture {
    TempDirectory temp;
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    FakeClipboard clipboard;
    AutomationSettings settings;

    Fixture() {
        settings.credentials.username = "robot";
        settings.credentials.password = "secret";
        settings.connection.startupTimeout = std::chrono::seconds(2);
        settings.connection.uiSearchTimeout = std::chrono::seconds(1);
        settings.exports.directoryA = temp.subdirectory("export-A");
        settings.exports.directoryB = temp.subdirectory("export-B");
        settings.exports.patternA = "export*.csv";
        settings.exports.fallbackPatternA = "*.csv";
        settings.exports.timeout = std::chrono::seconds(5);

        engine.addConnection(settings.connection.connectionLabel, engine.session);
        engine.session->addControls({
            controls::kExportPathField, controls::kExportSaveButton, controls::kMultiSelectButton,
            controls::kBackButton, controls::kCommandField
        });
    }

    // First save produces the record-source export, the second the bulk-lookup export
    void exportBothOnSave() {
        auto session = engine.session;
        std::string fileA = temp.file("export-A/export_20260219.csv");
        std::string fileB = temp.file("export-B/brs_20260219.XLSX");
        session->hooks[controls::kExportSaveButton] = [session, fileA, fileB]() {
            int presses = session->pressCount[controls::kExportSaveButton];
            writeFile(presses == 1 ? fileA : fileB, presses == 1 ? kRecordExport : "lookup");
        };
    }

    FakeSession& session() { return *engine.session; }
};

RunCommand period() {
    return RunCommand(CalendarDate(2026, 1, 19), CalendarDate(2026, 2, 19));
}

std::string act(const std::string& verb, const std::string& id, const std::string& value = "") {
    return value.empty() ? verb + ":" + id : verb + ":" + id + "=" + value;
}

} // anonymous namespace

void testFullRun() {
    Fixture f;
    f.exportBothOnSave();

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    RunResult result = orchestrator.run(period());

    expectEqual(result.recordCount, size_t(2), "unique identifiers");
    expectEqual(f.clipboard.text, std::string("123\r\n456"), "clipboard payload");
    expectEqual(result.exportPathA, ocal::filesystem::getAbsolutePath(f.temp.file("export-A/export_20260219.csv")),
                "first export");
    expectEqual(result.exportPathB, ocal::filesystem::getAbsolutePath(f.temp.file("export-B/brs_20260219.XLSX")),
                "second export");
    expect(utils::FileUtils::fileExists(result.auditCopyPath), "audit copy exists");
    expect(utils::StringUtils::startsWith(result.runId, "RUN-"), "run id assigned");
    expect(!orchestrator.isRunning(), "run flag cleared");

    FakeSession& session = f.session();
    expect(session.performed(act("setText", controls::kDateFromField, "19.01.2026")), "start date entered");
    expect(session.performed(act("setText", controls::kDateToField, "19.02.2026")), "end date entered");
    expectEqual(session.pressCount[controls::kBackButton], 3, "navigation reset between transactions");
    expect(session.indexOf(act("setText", controls::kCommandField, "zucrm_039")) <
           session.indexOf(act("setText", controls::kCommandField, "iw59")), "transactions in order");

    nlohmann::json json = result.toJson();
    expectEqual(json["record_count"].get<size_t>(), size_t(2), "json record count");
    expectEqual(json["run_id"].get<std::string>(), result.runId, "json run id");
}

void testWorkbookExportRun() {
    Fixture f;
    f.settings.exports.patternA = "export*.xlsx";
    f.settings.exports.fallbackPatternA = "*.xlsx";

    ZipBuilder zip;
    zip.add("xl/sharedStrings.xml", sharedStrings({"<t>Data</t>", "<t>N\xC2\xB0 Nota/Medida</t>", "<t>000456</t>"}), true);
    zip.add("xl/worksheets/sheet1.xml", worksheet(
        "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\" t=\"s\"><v>1</v></c></row>"
        "<row r=\"2\"><c r=\"A2\"><v>46041</v></c><c r=\"B2\"><v>123.0</v></c></row>"
        "<row r=\"3\"><c r=\"A3\"><v>46041</v></c><c r=\"B3\" t=\"s\"><v>2</v></c></row>"
        "<row r=\"4\"><c r=\"A4\"><v>46042</v></c><c r=\"B4\" t=\"inlineStr\"><is><t>9/000</t></is></c></row>"
        "<row r=\"5\"><c r=\"A5\"><v>46042</v></c><c r=\"B5\"><v>123</v></c></row>"), true);
    std::string workbook = zip.bytes();

    auto session = f.engine.session;
    std::string fileA = f.temp.file("export-A/EXPORT_20260219.XLSX");
    std::string fileB = f.temp.file("export-B/brs_20260219.XLSX");
    session->hooks[controls::kExportSaveButton] = [session, fileA, fileB, workbook]() {
        bool first = session->pressCount[controls::kExportSaveButton] == 1;
        writeFile(first ? fileA : fileB, first ? workbook : "lookup");
    };

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    RunResult result = orchestrator.run(period());

    expectEqual(result.exportPathA, ocal::filesystem::getAbsolutePath(fileA), "workbook export detected");
    expectEqual(result.recordCount, size_t(2), "unique identifiers from the workbook");
    expectEqual(f.clipboard.text, std::string("123\r\n456"), "numeric and text cells normalized");
}

void testRecordSourceTimeoutStopsRun() {
    Fixture f;

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    auto error = expectThrows<ExportTimeoutError>([&]() { orchestrator.run(period()); }, "no first export");

    expectEqual(error.pattern(), f.settings.exports.patternA, "first pattern reported");
    expectEqual(error.directory(), f.settings.exports.directoryA, "first directory reported");
    expectEqual(f.clipboard.writes, 0, "clipboard untouched");
    expect(!f.session().performed(act("setText", controls::kCommandField, "iw59")), "second transaction not entered");
    expect(!orchestrator.isRunning(), "run flag cleared");
}

void testEmptyRecordListStopsRun() {
    Fixture f;
    std::string fileA = f.temp.file("export-A/export_1.csv");
    f.session().hooks[controls::kExportSaveButton] = [fileA]() {
        writeFile(fileA, "No Nota/Medida;Status\n1/000;OPEN\n");
    };

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    auto error = expectThrows<AutomationError>([&]() { orchestrator.run(period()); }, "no identifiers");

    expect(error.type() == ErrorType::EXPORT_CONTENT, "export content error");
    expectEqual(f.clipboard.writes, 0, "clipboard untouched");
}

void testClipboardFailureStopsRun() {
    Fixture f;
    f.exportBothOnSave();
    f.clipboard.unavailable = true;

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    auto error = expectThrows<AutomationError>([&]() { orchestrator.run(period()); }, "clipboard locked");

    expect(error.type() == ErrorType::CLIPBOARD, "clipboard error");
    expect(!f.session().performed(act("setText", controls::kCommandField, "iw59")), "second transaction not entered");
}

void testMissingCredentials() {
    Fixture f;
    f.settings.credentials.password.clear();

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    auto error = expectThrows<AutomationError>([&]() { orchestrator.run(period()); }, "no password");

    expect(error.type() == ErrorType::CONFIGURATION, "configuration error");
    expectEqual(f.engine.descriptionCalls, 0, "no connection attempted");
}

void testInvalidPeriod() {
    Fixture f;

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    RunCommand reversed(CalendarDate(2026, 2, 19), CalendarDate(2026, 1, 19));
    expectThrows<ValidationError>([&]() { orchestrator.run(reversed); }, "end before start");

    expectEqual(f.engine.descriptionCalls, 0, "no connection attempted");
}

void testInvalidSettingsRejectedAtConstruction() {
    Fixture f;
    f.settings.exports.patternB.clear();

    auto error = expectThrows<AutomationError>([&]() {
        Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    }, "empty pattern");
    expect(error.type() == ErrorType::CONFIGURATION, "configuration error");
}

void testForeignExceptionIsWrapped() {
    Fixture f;
    f.session().hooks[controls::kExportSaveButton] = []() { throw std::runtime_error("printer on fire"); };

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    auto error = expectThrows<AutomationError>([&]() { orchestrator.run(period()); }, "unexpected exception");

    expect(error.type() == ErrorType::UNKNOWN, "unknown error type");
    expectEqual(error.getErrorInfo().details, std::string("printer on fire"), "original message kept");
}

void testConcurrentRunIsRejected() {
    Fixture f;
    std::promise<void> inside;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    auto session = f.engine.session;
    std::string fileA = f.temp.file("export-A/export_1.csv");
    std::string fileB = f.temp.file("export-B/brs_1.XLSX");
    session->hooks[controls::kExportSaveButton] = [&, session, fileA, fileB]() {
        int presses = session->pressCount[controls::kExportSaveButton];
        if (presses == 1) {
            inside.set_value();
            released.wait();
        }
        writeFile(presses == 1 ? fileA : fileB, presses == 1 ? kRecordExport : "lookup");
    };

    Orchestrator orchestrator(f.settings, f.engine, f.ui, f.clipboard, f.clock);
    std::future<RunResult> first = std::async(std::launch::async, [&]() { return orchestrator.run(period()); });

    inside.get_future().wait();
    bool inFlight = orchestrator.isRunning();
    bool rejected = false;
    try {
        orchestrator.run(period());
    } catch (const AutomationError& e) {
        rejected = e.type() == ErrorType::RUN_IN_PROGRESS;
    }
    release.set_value();
    RunResult result = first.get();

    expect(inFlight, "first run in flight");
    expect(rejected, "second run rejected with RUN_IN_PROGRESS");
    expectEqual(result.recordCount, size_t(2), "first run completes");
}

void testRunIdsAreDistinct() {
    std::string a = Orchestrator::generateRunId();
    std::string b = Orchestrator::generateRunId();
    expect(a != b, "fresh id per run");
    expectEqual(a.size(), std::string("RUN-20260219143005-0123abcd").size(), "id layout");
}

int main() {
    return runTests("Orchestrator", {
        {"full run", testFullRun},
        {"workbook export run", testWorkbookExportRun},
        {"record source timeout stops run", testRecordSourceTimeoutStopsRun},
        {"empty record list stops run", testEmptyRecordListStopsRun},
        {"clipboard failure stops run", testClipboardFailureStopsRun},
        {"missing credentials", testMissingCredentials},
        {"invalid period", testInvalidPeriod},
        {"invalid settings rejected at construction", testInvalidSettingsRejectedAtConstruction},
        {"foreign exception is wrapped", testForeignExceptionIsWrapped},
        {"concurrent run is rejected", testConcurrentRunIsRejected},
        {"run ids are distinct", testRunIdsAreDistinct}
    });
}
