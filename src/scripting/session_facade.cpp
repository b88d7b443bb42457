#include "session_facade.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace exportflow {
namespace scripting {

void waitForControl(ISessionFacade& session,
                    const std::string& controlId,
                    IClock& clock,
                    std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval) {
    PollOutcome outcome = pollUntil(clock, PollPolicy(interval, timeout), [&]() {
        return session.exists(controlId);
    });

    if (!outcome.satisfied) {
        throw ControlResolutionError(controlId, "control did not appear within " +
                                     std::to_string(timeout.count()) + " ms");
    }
    SLOG_DEBUG().message("Control available")
        .context("control_id", controlId)
        .context("waited_ms", outcome.elapsed.count());
}

} // namespace scripting
} // namespace exportflow
