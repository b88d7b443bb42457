#include "test_support.h"
#include "automation/session_connector.h"
#include "automation/launcher_ui_automation.h"
#include "automation/control_ids.h"

using namespace exportflow;
using namespace exportflow::testing;
using automation::SessionConnector;
using ocal::uia::UiElementKind;

namespace {

const std::string kConnection = "H181 RP1 ENEL SP CCS Produ\xC3\xA7\xC3\xA3o (without SSO)";
const std::string kServer = "00 SAP ERP";

ConnectionSettings connectionSettings() {
    ConnectionSettings settings;
    settings.serverLabel = kServer;
    settings.connectionLabel = kConnection;
    settings.startupTimeout = std::chrono::milliseconds(2000);
    settings.uiSearchTimeout = std::chrono::milliseconds(1000);
    return settings;
}

CredentialSettings credentialSettings() {
    CredentialSettings credentials;
    credentials.username = "robot";
    credentials.password = "secret";
    credentials.client = "300";
    credentials.language = "PT";
    return credentials;
}

void addLoginScreen(FakeSession& session) {
    session.addControls({controls::kLoginUser, controls::kLoginPassword, controls::kLoginClient});
}

} // anonymous namespace

void testReusesOpenConnectionWithoutLogin() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;

    auto other = std::make_shared<FakeSession>();
    auto target = std::make_shared<FakeSession>();
    target->addControls({"marker"});
    addLoginScreen(*target);
    engine.addConnection("Quality system", other);
    engine.addConnection(kConnection, target);

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    auto session = connector.connect();

    expect(session->exists("marker"), "session of the matching connection returned");
    expect(engine.opened.empty(), "nothing opened");
    expect(target->actions.empty(), "no login on a reused session");
    expectEqual(ui.attachCalls, 0, "launcher window untouched");
}

void testDirectOpenLogsIn() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    engine.accepted.insert(kConnection);
    addLoginScreen(*engine.session);

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    auto session = connector.connect();

    expect(session != nullptr, "session returned");
    expectEqual(engine.opened.size(), size_t(1), "connection label accepted on first try");
    FakeSession& fake = *engine.session;
    expect(fake.performed(std::string("setText:") + controls::kLoginUser + "=robot"), "username written");
    expect(fake.performed(std::string("setText:") + controls::kLoginPassword + "=secret"), "password written");
    expect(fake.performed(std::string("setText:") + controls::kLoginClient + "=300"), "client written");
    expect(fake.texts.count(controls::kLoginLanguage) == 0, "absent language field skipped");
    expect(fake.performed(std::string("sendVKey:") + controls::kMainWindow + "=0"), "login confirmed with Enter");
}

void testDirectOpenFallsBackToServerLabel() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    engine.accepted.insert(kServer);

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    connector.connect();

    expectEqual(engine.opened.size(), size_t(2), "two candidates tried");
    expectEqual(engine.opened[0], kConnection, "connection label first");
    expectEqual(engine.opened[1], kServer, "server label second");
    expect(engine.session->actions.empty(), "no credential screen, no login");
}

void testDirectOpenUsesReturnedPosition() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    engine.accepted.insert(kConnection);
    engine.openAtFront = true;
    addLoginScreen(*engine.session);

    auto other = std::make_shared<FakeSession>();
    addLoginScreen(*other);
    engine.addConnection("Quality system", other);

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    connector.connect();

    expectEqual(engine.descriptions.back(), std::string("Quality system"), "new connection not listed last");
    expect(engine.session->performed(std::string("sendVKey:") + controls::kMainWindow + "=0"),
           "opened connection logged in");
    expect(other->actions.empty(), "last listed connection untouched");
}

void testLauncherUiFallback() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    addLoginScreen(*engine.session);

    ui.items[UiElementKind::TREE_ITEM] = {"Favoritos", "00 SAP ERP", "01 SAP BW"};
    ui.items[UiElementKind::DATA_ITEM] = {"  ", "H181 RP1 ENEL SP CCS Producao (without SSO)", "H181 QA1 ENEL"};
    ui.items[UiElementKind::LIST_ITEM] = {"H181 RP1 ENEL SP CCS Producao (without SSO)"};
    ui.onActivate = [&](const std::string& row) { engine.addConnection(row, engine.session); };

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    auto session = connector.connect();

    expect(session != nullptr, "session returned");
    expect(ui.focused, "launcher window focused");
    expectEqual(ui.lastPattern, std::string("SAP Logon.*"), "default window pattern");
    expectEqual(ui.selected.size(), size_t(1), "one tree node selected");
    expectEqual(ui.selected[0], kServer, "server node selected");
    expectEqual(ui.activated.size(), size_t(1), "one row activated");
    expectEqual(ui.activated[0], std::string("H181 RP1 ENEL SP CCS Producao (without SSO)"), "best row activated");
    expect(engine.session->performed(std::string("sendVKey:") + controls::kMainWindow + "=0"), "logged in");
}

void testAbsentTargetRaisesConnectionError() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    ui.items[UiElementKind::DATA_ITEM] = {"Other system A", "Other system B"};

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    auto error = expectThrows<ConnectionError>([&]() { connector.connect(); }, "absent label");

    expectEqual(std::string(error.what()), std::string("connection entry not found"), "message");
    expectEqual(error.serverLabel(), kServer, "server label carried");
    expectEqual(error.connectionLabel(), kConnection, "connection label carried");
    expect(error.getErrorInfo().details.find("launcher-ui") != std::string::npos, "last strategy named in details");
    expect(error.getErrorInfo().details.find("Other system A") != std::string::npos, "visible rows listed");
    expect(ui.activated.empty(), "nothing activated");
}

void testMissingLauncherWindowTimesOut() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    ui.windowVisible = false;

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    expectThrows<ConnectionError>([&]() { connector.connect(); }, "no launcher window");

    expect(clock.totalSlept() >= std::chrono::milliseconds(1000), "window searched for the full timeout");
    expect(clock.totalSlept() < std::chrono::milliseconds(1500), "search bounded by the timeout");
    expect(ui.attachCalls >= 2, "window polled repeatedly");
}

void testSessionThatNeverAppearsFails() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    ui.windowVisible = false;
    engine.sessionReady = false;
    engine.addConnection(kConnection, std::make_shared<FakeSession>());

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    auto error = expectThrows<ConnectionError>([&]() { connector.connect(); }, "session never ready");

    expect(clock.totalSlept() >= std::chrono::milliseconds(2000), "first session awaited for the startup timeout");
    expect(engine.firstSessionCalls > 1, "first session polled");
    expect(error.getErrorInfo().type == ErrorType::CONNECTION, "connection error type");
}

void testAttemptsRepeatTheChain() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    ui.windowVisible = false;

    ConnectionSettings settings = connectionSettings();
    settings.connectAttempts = 2;
    SessionConnector connector(engine, ui, clock, settings, credentialSettings());
    expectThrows<ConnectionError>([&]() { connector.connect(); }, "all attempts fail");

    expectEqual(engine.opened.size(), size_t(4), "both candidates tried in each attempt");
}

void testLoginSkippedWhenAuthenticated() {
    ManualClock clock;
    FakeEngine engine;
    FakeUiTree ui;
    FakeSession session;
    session.addControls({controls::kCommandField});

    SessionConnector connector(engine, ui, clock, connectionSettings(), credentialSettings());
    connector.loginIfRequired(session);

    expect(session.actions.empty(), "no field written");
}

int main() {
    return runTests("SessionConnector", {
        {"reuse open connection without login", testReusesOpenConnectionWithoutLogin},
        {"direct open logs in", testDirectOpenLogsIn},
        {"direct open falls back to server label", testDirectOpenFallsBackToServerLabel},
        {"direct open uses the returned connection position", testDirectOpenUsesReturnedPosition},
        {"launcher window fallback", testLauncherUiFallback},
        {"absent target raises ConnectionError", testAbsentTargetRaisesConnectionError},
        {"missing launcher window times out", testMissingLauncherWindowTimesOut},
        {"session that never appears fails", testSessionThatNeverAppearsFails},
        {"connect attempts repeat the chain", testAttemptsRepeatTheChain},
        {"login skipped when authenticated", testLoginSkippedWhenAuthenticated}
    });
}
