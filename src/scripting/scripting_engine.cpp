#include "scripting_engine.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include "../ocal/process_operations.h"

#ifdef _WIN32
#include "com_dispatch.h"
#include "gui_scripting_session.h"
#include <filesystem>
#include <optional>
#endif

namespace exportflow {
namespace scripting {

namespace {
    constexpr std::chrono::milliseconds kAttachPollInterval(1000);
}

LauncherStartup::LauncherStartup(const ConnectionSettings& settings, IClock& clock, LaunchAction launch)
    : m_settings(settings), m_clock(clock), m_launch(std::move(launch)) {}

void LauncherStartup::ensureAttached(const AttachProbe& attach) {
    if (attach()) {
        return;
    }
    if (m_failure) {
        std::rethrow_exception(m_failure);
    }

    try {
        SLOG_INFO().message("Scripting engine not running, starting launcher").context("path", m_settings.launcherPath);
        ++m_launchCount;
        m_launch();

        PollOutcome outcome = pollUntil(m_clock, PollPolicy(kAttachPollInterval, m_settings.startupTimeout), attach);
        if (!outcome.satisfied) {
            throw ConnectionError("scripting engine not reachable", m_settings.serverLabel, m_settings.connectionLabel,
                                  "launcher started but the scripting engine did not register within " +
                                  std::to_string(m_settings.startupTimeout.count()) +
                                  " ms; check that scripting is enabled");
        }
    } catch (const ConnectionError&) {
        m_failure = std::current_exception();
        throw;
    }
    SLOG_INFO().message("Attached to scripting engine");
}

#ifdef _WIN32

struct GuiScriptingEngine::Impl {
    ConnectionSettings settings;
    ComApartment apartment;
    DispatchObject engine;
    LauncherStartup startup;

    Impl(const ConnectionSettings& s, IClock& c)
        : settings(s), startup(s, c, [this]() { launchLauncher(); }) {}

    // Running object table entry -> scripting engine; nullopt while not registered
    std::optional<DispatchObject> tryAttach() {
        CLSID clsid;
        if (FAILED(CLSIDFromProgID(L"SapROTWr.SapROTWrapper", &clsid))) {
            return std::nullopt;
        }

        Microsoft::WRL::ComPtr<IDispatch> wrapper;
        if (FAILED(CoCreateInstance(clsid, nullptr, CLSCTX_ALL, IID_PPV_ARGS(&wrapper))) || !wrapper) {
            return std::nullopt;
        }

        try {
            std::vector<Variant> args;
            args.emplace_back(std::string("SAPGUI"));
            DispatchObject guiAuto = DispatchObject(wrapper).callObject(L"GetROTEntry", std::move(args));
            return guiAuto.getObject(L"GetScriptingEngine");
        } catch (const AutomationError& e) {
            SLOG_DEBUG().message("Scripting engine not attachable yet").context("details", e.getErrorInfo().details);
            return std::nullopt;
        }
    }

    void launchLauncher() {
        const std::string& path = settings.launcherPath;
        if (path.empty()) {
            throw ConnectionError("launcher executable not configured", settings.serverLabel,
                                  settings.connectionLabel, "connection.launcher_path is empty");
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw ConnectionError("launcher executable not found", settings.serverLabel,
                                  settings.connectionLabel, path);
        }
        unsigned long processId = 0;
        if (!ocal::process::launchDetached(path, processId)) {
            throw ConnectionError("failed to start the launcher", settings.serverLabel,
                                  settings.connectionLabel, path);
        }
    }

    DispatchObject& ensureEngine() {
        if (engine.valid()) {
            return engine;
        }

        startup.ensureAttached([this]() {
            if (auto attached = tryAttach()) {
                engine = *attached;
                return true;
            }
            return false;
        });
        return engine;
    }
};

GuiScriptingEngine::GuiScriptingEngine(const ConnectionSettings& settings, IClock& clock)
    : m_impl(std::make_unique<Impl>(settings, clock)) {}

GuiScriptingEngine::~GuiScriptingEngine() = default;

std::vector<std::string> GuiScriptingEngine::connectionDescriptions() {
    DispatchObject& engine = m_impl->ensureEngine();
    std::vector<std::string> descriptions;

    long count = engine.getObject(L"Children").getLong(L"Count");
    for (long i = 0; i < count; ++i) {
        std::vector<Variant> args;
        args.emplace_back(i);
        try {
            descriptions.push_back(engine.callObject(L"Children", std::move(args)).getString(L"Description"));
        } catch (const AutomationError& e) {
            // Connection closed while enumerating; keep positions aligned
            SLOG_DEBUG().message("Connection not readable").context("index", i).context("details", e.getErrorInfo().details);
            descriptions.emplace_back();
        }
    }
    return descriptions;
}

std::unique_ptr<ISessionFacade> GuiScriptingEngine::firstSession(size_t connectionIndex) {
    DispatchObject& engine = m_impl->ensureEngine();

    std::vector<Variant> connectionArgs;
    connectionArgs.emplace_back(static_cast<long>(connectionIndex));
    DispatchObject connection = engine.callObject(L"Children", std::move(connectionArgs));

    if (connection.getObject(L"Children").getLong(L"Count") <= 0) {
        return nullptr;
    }

    std::vector<Variant> sessionArgs;
    sessionArgs.emplace_back(0L);
    return std::make_unique<GuiScriptingSession>(connection.callObject(L"Children", std::move(sessionArgs)));
}

size_t GuiScriptingEngine::openConnection(const std::string& entryLabel) {
    DispatchObject& engine = m_impl->ensureEngine();
    std::vector<Variant> args;
    args.emplace_back(entryLabel);
    args.emplace_back(true);
    std::string id = engine.callObject(L"OpenConnection", std::move(args)).getString(L"Id");

    // Newly opened connections are usually last; search from the end
    long count = engine.getObject(L"Children").getLong(L"Count");
    for (long i = count - 1; i >= 0; --i) {
        std::vector<Variant> childArgs;
        childArgs.emplace_back(i);
        if (engine.callObject(L"Children", std::move(childArgs)).getString(L"Id") == id) {
            SLOG_INFO().message("Connection opened").context("entry", entryLabel).context("id", id);
            return static_cast<size_t>(i);
        }
    }
    throw AutomationError(ErrorType::PLATFORM, "Opened connection not listed", entryLabel + " (" + id + ")");
}

#else

struct GuiScriptingEngine::Impl {};

GuiScriptingEngine::GuiScriptingEngine(const ConnectionSettings& settings, IClock& clock)
    : m_impl(std::make_unique<Impl>()) {
    (void)settings;
    (void)clock;
}

GuiScriptingEngine::~GuiScriptingEngine() = default;

namespace {

[[noreturn]] void throwUnsupported() {
    throw AutomationError(ErrorType::PLATFORM, "GUI scripting is only available on Windows",
                          "the scripting engine is a COM server of the desktop launcher");
}

} // anonymous namespace

std::vector<std::string> GuiScriptingEngine::connectionDescriptions() {
    throwUnsupported();
}

std::unique_ptr<ISessionFacade> GuiScriptingEngine::firstSession(size_t connectionIndex) {
    (void)connectionIndex;
    throwUnsupported();
}

size_t GuiScriptingEngine::openConnection(const std::string& entryLabel) {
    (void)entryLabel;
    throwUnsupported();
}

#endif // _WIN32

} // namespace scripting
} // namespace exportflow
