#include "gui_scripting_session.h"

#ifdef _WIN32

#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace exportflow {
namespace scripting {

GuiScriptingSession::GuiScriptingSession(DispatchObject session) : m_session(std::move(session)) {}

DispatchObject GuiScriptingSession::find(const std::string& controlId) {
    std::vector<Variant> args;
    args.emplace_back(controlId);
    try {
        return m_session.callObject(L"findById", std::move(args));
    } catch (const AutomationError& e) {
        throw ControlResolutionError(controlId, e.getErrorInfo().details);
    }
}

template<typename Action>
void GuiScriptingSession::drive(const std::string& controlId, Action&& action) {
    DispatchObject control = find(controlId);
    try {
        action(control);
    } catch (const AutomationError& e) {
        throw ControlResolutionError(controlId, e.getErrorInfo().details);
    }
}

bool GuiScriptingSession::exists(const std::string& controlId) {
    try {
        find(controlId);
        return true;
    } catch (const ControlResolutionError&) {
        return false;
    }
}

void GuiScriptingSession::setText(const std::string& controlId, const std::string& text) {
    drive(controlId, [&](const DispatchObject& control) {
        control.put(L"text", Variant(text));
    });
}

void GuiScriptingSession::press(const std::string& controlId) {
    drive(controlId, [](const DispatchObject& control) {
        control.call(L"press");
    });
}

void GuiScriptingSession::select(const std::string& controlId) {
    drive(controlId, [](const DispatchObject& control) {
        control.call(L"select");
    });
}

void GuiScriptingSession::setFocus(const std::string& controlId) {
    drive(controlId, [](const DispatchObject& control) {
        control.call(L"setFocus");
    });
}

void GuiScriptingSession::setCaretPosition(const std::string& controlId, int position) {
    drive(controlId, [position](const DispatchObject& control) {
        control.put(L"caretPosition", Variant(static_cast<long>(position)));
    });
}

void GuiScriptingSession::sendVKey(const std::string& windowId, int keyCode) {
    drive(windowId, [keyCode](const DispatchObject& control) {
        std::vector<Variant> args;
        args.emplace_back(static_cast<long>(keyCode));
        control.call(L"sendVKey", std::move(args));
    });
}

void GuiScriptingSession::maximize(const std::string& windowId) {
    drive(windowId, [](const DispatchObject& control) {
        control.call(L"maximize");
    });
}

} // namespace scripting
} // namespace exportflow

#endif // _WIN32
