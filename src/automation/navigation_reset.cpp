#include "navigation_reset.h"
#include "control_ids.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace exportflow {
namespace automation {

NavigationReset::NavigationReset(IClock& clock, const NavigationSettings& settings)
    : m_clock(clock), m_settings(settings) {}

int NavigationReset::maxPresses() const {
    return std::max(kNavigationMinPresses, std::min(m_settings.maxBackPresses, kNavigationUpperBound));
}

int NavigationReset::run(scripting::ISessionFacade& session) {
    const int limit = maxPresses();
    int pressed = 0;

    while (pressed < limit) {
        if (!session.exists(controls::kBackButton)) {
            SLOG_INFO().message("Back button unavailable, continuing").context("presses", pressed);
            return pressed;
        }

        session.press(controls::kBackButton);
        ++pressed;
        m_clock.sleepFor(m_settings.pressDelay);

        if (pressed >= kNavigationMinPresses && session.exists(controls::kCommandField)) {
            break;
        }
    }

    SLOG_INFO().message("Navigation reset finished").context("presses", pressed).context("limit", limit);
    return pressed;
}

} // namespace automation
} // namespace exportflow
