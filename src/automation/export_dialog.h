#ifndef EXPORTFLOW_EXPORT_DIALOG_H
#define EXPORTFLOW_EXPORT_DIALOG_H

#include <string>
#include <filesystem>
#include "../scripting/session_facade.h"
#include "../common/clock.h"

namespace exportflow {
namespace automation {

/**
 * @brief Completes the application's "save list to file" popup
 *
 * Confirms an intermediate popup when the path field is not shown yet,
 * writes the target directory, saves and accepts the overwrite question.
 */
class ExportDialog {
public:
    ExportDialog(scripting::ISessionFacade& session, IClock& clock);

    /**
     * @return Filesystem time just before the save was confirmed
     * @throws ControlResolutionError for the save button when neither save nor OK is shown
     */
    std::filesystem::file_time_type save(const std::string& directory);

private:
    scripting::ISessionFacade& m_session;
    IClock& m_clock;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_EXPORT_DIALOG_H
