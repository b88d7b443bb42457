#ifndef EXPORTFLOW_SESSION_CONNECTOR_H
#define EXPORTFLOW_SESSION_CONNECTOR_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "../scripting/session_facade.h"
#include "../scripting/scripting_engine.h"
#include "../ocal/ui_automation.h"
#include "../common/clock.h"
#include "../common/config_manager.h"

namespace exportflow {
namespace automation {

/**
 * @brief Establishes or reuses the application session for one run
 *
 * Strategies are tried in order, first success wins:
 * 1. reuse an open connection whose description contains the connection label
 * 2. open the entry through the scripting API (connection label, then server label)
 * 3. drive the launcher window and double-click the best-matching row
 *
 * A strategy failure is logged and the next one is tried. The whole chain
 * runs up to connectAttempts times before ConnectionError is raised.
 */
class SessionConnector {
public:
    SessionConnector(scripting::IScriptingEngine& engine,
                     ocal::uia::IUiTree& uiTree,
                     IClock& clock,
                     const ConnectionSettings& connection,
                     const CredentialSettings& credentials);

    std::unique_ptr<scripting::ISessionFacade> connect();

    // Fills the credential screen when it is shown; no-op for an authenticated session
    void loginIfRequired(scripting::ISessionFacade& session);

private:
    struct Strategy {
        std::string name;
        std::function<std::unique_ptr<scripting::ISessionFacade>()> attempt;
        bool requiresLogin;
    };

    std::vector<Strategy> strategies();

    std::unique_ptr<scripting::ISessionFacade> reuseExisting();
    std::unique_ptr<scripting::ISessionFacade> openDirect();
    std::unique_ptr<scripting::ISessionFacade> openThroughLauncherUi();
    std::unique_ptr<scripting::ISessionFacade> awaitFirstSession(size_t connectionIndex);

    scripting::IScriptingEngine& m_engine;
    ocal::uia::IUiTree& m_uiTree;
    IClock& m_clock;
    ConnectionSettings m_connection;
    CredentialSettings m_credentials;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_SESSION_CONNECTOR_H
