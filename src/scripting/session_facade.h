#ifndef EXPORTFLOW_SESSION_FACADE_H
#define EXPORTFLOW_SESSION_FACADE_H

#include <string>
#include <chrono>
#include "../common/clock.h"

namespace exportflow {
namespace scripting {

/**
 * @brief Control-level access to one live application session
 *
 * Controls are addressed by their scripting id ("wnd[0]/tbar[0]/okcd").
 * Every action throws ControlResolutionError carrying the id when the
 * control cannot be found or driven. exists() never throws for a missing
 * control.
 */
class ISessionFacade {
public:
    virtual ~ISessionFacade() = default;

    virtual bool exists(const std::string& controlId) = 0;
    virtual void setText(const std::string& controlId, const std::string& text) = 0;
    virtual void press(const std::string& controlId) = 0;
    virtual void select(const std::string& controlId) = 0;
    virtual void setFocus(const std::string& controlId) = 0;
    virtual void setCaretPosition(const std::string& controlId, int position) = 0;
    virtual void sendVKey(const std::string& windowId, int keyCode) = 0;
    virtual void maximize(const std::string& windowId) = 0;
};

/**
 * @brief Polls until the control exists
 * @throws ControlResolutionError naming the control when the timeout passes
 */
void waitForControl(ISessionFacade& session,
                    const std::string& controlId,
                    IClock& clock,
                    std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(300));

} // namespace scripting
} // namespace exportflow

#endif // EXPORTFLOW_SESSION_FACADE_H
