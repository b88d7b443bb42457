#include "session_connector.h"
#include "launcher_ui_automation.h"
#include "control_ids.h"
#include "../common/string_utils.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace exportflow {
namespace automation {

using scripting::ISessionFacade;
using utils::StringUtils;

namespace {
    constexpr std::chrono::milliseconds kSessionPollInterval(500);
}

SessionConnector::SessionConnector(scripting::IScriptingEngine& engine,
                                   ocal::uia::IUiTree& uiTree,
                                   IClock& clock,
                                   const ConnectionSettings& connection,
                                   const CredentialSettings& credentials)
    : m_engine(engine), m_uiTree(uiTree), m_clock(clock),
      m_connection(connection), m_credentials(credentials) {}

std::vector<SessionConnector::Strategy> SessionConnector::strategies() {
    return {
        {"reuse", [this]() { return reuseExisting(); }, false},
        {"direct-open", [this]() { return openDirect(); }, true},
        {"launcher-ui", [this]() { return openThroughLauncherUi(); }, true}
    };
}

std::unique_ptr<ISessionFacade> SessionConnector::connect() {
    SCOPED_TIMER("session_connect");
    SLOG_INFO().message("Connecting to application session")
        .context("server_label", m_connection.serverLabel)
        .context("connection_label", m_connection.connectionLabel);

    std::string lastFailure = "no strategy produced a session";
    for (int attempt = 1; attempt <= m_connection.connectAttempts; ++attempt) {
        for (const auto& strategy : strategies()) {
            std::unique_ptr<ISessionFacade> session;
            try {
                session = strategy.attempt();
            } catch (const AutomationError& e) {
                lastFailure = strategy.name + ": " + e.what();
                if (!e.getErrorInfo().details.empty()) {
                    lastFailure += " (" + e.getErrorInfo().details + ")";
                }
                SLOG_WARNING().message("Connection strategy failed")
                    .context("strategy", strategy.name)
                    .context("attempt", attempt)
                    .context("error", e.what())
                    .context("details", e.getErrorInfo().details);
                continue;
            }

            if (!session) {
                SLOG_DEBUG().message("Connection strategy not applicable").context("strategy", strategy.name);
                continue;
            }

            SLOG_INFO().message("Session established").context("strategy", strategy.name).context("attempt", attempt);
            if (strategy.requiresLogin) {
                loginIfRequired(*session);
            }
            return session;
        }
    }

    throw ConnectionError("connection entry not found", m_connection.serverLabel,
                          m_connection.connectionLabel, lastFailure);
}

std::unique_ptr<ISessionFacade> SessionConnector::reuseExisting() {
    std::string target = StringUtils::toLowerCase(m_connection.connectionLabel);
    if (target.empty()) {
        return nullptr;
    }

    std::vector<std::string> descriptions = m_engine.connectionDescriptions();
    for (size_t i = 0; i < descriptions.size(); ++i) {
        if (StringUtils::toLowerCase(descriptions[i]).find(target) != std::string::npos) {
            SLOG_INFO().message("Reusing open connection").context("description", descriptions[i]);
            return awaitFirstSession(i);
        }
    }
    return nullptr;
}

std::unique_ptr<ISessionFacade> SessionConnector::openDirect() {
    std::string lastError;
    for (const auto& candidate : {m_connection.connectionLabel, m_connection.serverLabel}) {
        if (candidate.empty()) {
            continue;
        }
        size_t index = 0;
        try {
            index = m_engine.openConnection(candidate);
        } catch (const AutomationError& e) {
            lastError = e.what();
            SLOG_DEBUG().message("Launcher rejected entry").context("entry", candidate).context("error", e.what());
            continue;
        }

        SLOG_INFO().message("Connection opened by entry").context("entry", candidate).context("index", index);
        return awaitFirstSession(index);
    }

    throw ConnectionError("launcher could not open any candidate entry", m_connection.serverLabel,
                          m_connection.connectionLabel, lastError);
}

std::unique_ptr<ISessionFacade> SessionConnector::openThroughLauncherUi() {
    size_t before = m_engine.connectionDescriptions().size();

    LauncherUiAutomation launcher(m_uiTree, m_clock, m_connection);
    launcher.openConnection();

    size_t after = before;
    PollOutcome outcome = pollUntil(m_clock, PollPolicy(kSessionPollInterval, m_connection.startupTimeout), [&]() {
        after = m_engine.connectionDescriptions().size();
        return after > before;
    });
    if (!outcome.satisfied) {
        throw ConnectionError("launcher row activated but no connection appeared", m_connection.serverLabel,
                              m_connection.connectionLabel);
    }
    return awaitFirstSession(after - 1);
}

std::unique_ptr<ISessionFacade> SessionConnector::awaitFirstSession(size_t connectionIndex) {
    std::chrono::milliseconds waited(0);
    auto session = pollFor<std::unique_ptr<ISessionFacade>>(
        m_clock, PollPolicy(kSessionPollInterval, m_connection.startupTimeout),
        [&]() -> std::optional<std::unique_ptr<ISessionFacade>> {
            auto candidate = m_engine.firstSession(connectionIndex);
            if (candidate) {
                return std::optional<std::unique_ptr<ISessionFacade>>(std::move(candidate));
            }
            return std::nullopt;
        },
        &waited);

    if (!session) {
        throw ConnectionError("timed out waiting for the first session", m_connection.serverLabel,
                              m_connection.connectionLabel,
                              "connection index " + std::to_string(connectionIndex) + ", waited " +
                              std::to_string(waited.count()) + " ms");
    }
    return std::move(*session);
}

void SessionConnector::loginIfRequired(ISessionFacade& session) {
    if (!session.exists(controls::kLoginUser)) {
        SLOG_INFO().message("Session already authenticated");
        return;
    }

    SLOG_INFO().message("Logging in").context("username", m_credentials.username);
    session.setText(controls::kLoginUser, m_credentials.username);
    session.setText(controls::kLoginPassword, m_credentials.password);

    if (!m_credentials.client.empty() && session.exists(controls::kLoginClient)) {
        session.setText(controls::kLoginClient, m_credentials.client);
    }
    if (!m_credentials.language.empty() && session.exists(controls::kLoginLanguage)) {
        session.setText(controls::kLoginLanguage, m_credentials.language);
    }

    session.sendVKey(controls::kMainWindow, controls::kEnterKey);
}

} // namespace automation
} // namespace exportflow
