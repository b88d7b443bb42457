#ifndef EXPORTFLOW_LAUNCHER_UI_AUTOMATION_H
#define EXPORTFLOW_LAUNCHER_UI_AUTOMATION_H

#include <string>
#include <vector>
#include "../ocal/ui_automation.h"
#include "../common/clock.h"
#include "../common/config_manager.h"

namespace exportflow {
namespace automation {

/**
 * @brief Opens a connection by driving the launcher window itself
 *
 * Used when the scripting API refuses to open the entry. The server node in
 * the left-hand tree is selected (a missing node only logs a warning) and the
 * best-matching row of the connection grid is double-clicked.
 */
class LauncherUiAutomation {
public:
    LauncherUiAutomation(ocal::uia::IUiTree& tree, IClock& clock, const ConnectionSettings& settings);

    // Throws ConnectionError when the window or a matching row cannot be found
    void openConnection();

private:
    void attachWindow();
    void selectServer();
    void activateConnection();
    std::vector<ocal::uia::UiNode> collectRows();

    ocal::uia::IUiTree& m_tree;
    IClock& m_clock;
    ConnectionSettings m_settings;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_LAUNCHER_UI_AUTOMATION_H
