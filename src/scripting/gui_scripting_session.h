#ifndef EXPORTFLOW_GUI_SCRIPTING_SESSION_H
#define EXPORTFLOW_GUI_SCRIPTING_SESSION_H

#ifdef _WIN32

#include "session_facade.h"
#include "com_dispatch.h"

namespace exportflow {
namespace scripting {

/**
 * @brief ISessionFacade over a scripting session object (findById based)
 */
class GuiScriptingSession : public ISessionFacade {
public:
    explicit GuiScriptingSession(DispatchObject session);

    bool exists(const std::string& controlId) override;
    void setText(const std::string& controlId, const std::string& text) override;
    void press(const std::string& controlId) override;
    void select(const std::string& controlId) override;
    void setFocus(const std::string& controlId) override;
    void setCaretPosition(const std::string& controlId, int position) override;
    void sendVKey(const std::string& windowId, int keyCode) override;
    void maximize(const std::string& windowId) override;

private:
    DispatchObject find(const std::string& controlId);

    template<typename Action>
    void drive(const std::string& controlId, Action&& action);

    DispatchObject m_session;
};

} // namespace scripting
} // namespace exportflow

#endif // _WIN32

#endif // EXPORTFLOW_GUI_SCRIPTING_SESSION_H
