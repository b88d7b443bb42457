#ifndef EXPORTFLOW_SCRIPTING_ENGINE_H
#define EXPORTFLOW_SCRIPTING_ENGINE_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <exception>
#include "session_facade.h"
#include "../common/clock.h"
#include "../common/config_manager.h"

namespace exportflow {
namespace scripting {

/**
 * @brief Launcher-side scripting surface: open connections and their sessions
 *
 * Connections are addressed by their position in the engine's connection
 * collection.
 */
class IScriptingEngine {
public:
    virtual ~IScriptingEngine() = default;

    virtual std::vector<std::string> connectionDescriptions() = 0;

    // First session of the connection, or nullptr while it has none
    virtual std::unique_ptr<ISessionFacade> firstSession(size_t connectionIndex) = 0;

    // Asks the launcher to open a connection entry and returns the position of
    // the new connection; throws AutomationError when rejected
    virtual size_t openConnection(const std::string& entryLabel) = 0;
};

/**
 * @brief Starts the launcher at most once and waits for the engine to register
 *
 * ensureAttached() runs the attach probe first. Only the first call that
 * finds nothing registered starts the launcher and polls for the startup
 * timeout. Once that start has failed, later calls make one more attach
 * attempt and then rethrow the same ConnectionError without launching again.
 */
class LauncherStartup {
public:
    using AttachProbe = std::function<bool()>;
    using LaunchAction = std::function<void()>;

    LauncherStartup(const ConnectionSettings& settings, IClock& clock, LaunchAction launch);

    void ensureAttached(const AttachProbe& attach);

    int launchCount() const { return m_launchCount; }

private:
    ConnectionSettings m_settings;
    IClock& m_clock;
    LaunchAction m_launch;
    int m_launchCount = 0;
    std::exception_ptr m_failure;
};

/**
 * @brief IScriptingEngine over the desktop application's COM scripting API
 *
 * The engine is attached lazily on first use through the running object
 * table. When nothing is registered yet, the launcher executable is started
 * once and the engine is polled for up to the startup timeout.
 */
class GuiScriptingEngine : public IScriptingEngine {
public:
    GuiScriptingEngine(const ConnectionSettings& settings, IClock& clock);
    ~GuiScriptingEngine() override;

    GuiScriptingEngine(const GuiScriptingEngine&) = delete;
    GuiScriptingEngine& operator=(const GuiScriptingEngine&) = delete;

    std::vector<std::string> connectionDescriptions() override;
    std::unique_ptr<ISessionFacade> firstSession(size_t connectionIndex) override;
    size_t openConnection(const std::string& entryLabel) override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace scripting
} // namespace exportflow

#endif // EXPORTFLOW_SCRIPTING_ENGINE_H
