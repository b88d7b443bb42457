#ifndef EXPORTFLOW_NAVIGATION_RESET_H
#define EXPORTFLOW_NAVIGATION_RESET_H

#include "../scripting/session_facade.h"
#include "../common/clock.h"
#include "../common/config_manager.h"

namespace exportflow {
namespace automation {

/**
 * @brief Backs out of the finished transaction to the command screen
 *
 * Presses back at least kNavigationMinPresses times and at most
 * clamp(maxBackPresses, min, kNavigationUpperBound) times. After the
 * minimum it stops as soon as the command field is available. A missing
 * back button ends the reset early without error.
 */
class NavigationReset {
public:
    NavigationReset(IClock& clock, const NavigationSettings& settings);

    // Number of presses performed
    int run(scripting::ISessionFacade& session);

    int maxPresses() const;

private:
    IClock& m_clock;
    NavigationSettings m_settings;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_NAVIGATION_RESET_H
