#include "export_dialog.h"
#include "control_ids.h"
#include "../common/error_handler.h"
#include "../common/os_utils.h"
#include "../common/structured_logger.h"
#include "../ocal/filesystem_operations.h"

namespace exportflow {
namespace automation {

ExportDialog::ExportDialog(scripting::ISessionFacade& session, IClock& clock)
    : m_session(session), m_clock(clock) {}

std::filesystem::file_time_type ExportDialog::save(const std::string& directory) {
    if (!ocal::filesystem::createDirectory(directory)) {
        throw AutomationError(ErrorType::CONFIGURATION, "Export directory cannot be created", directory);
    }

    if (m_session.exists(controls::kDialogOkButton) && !m_session.exists(controls::kExportPathField)) {
        m_session.press(controls::kDialogOkButton);
        m_clock.sleepFor(std::chrono::milliseconds(200));
    }

    if (m_session.exists(controls::kExportPathField)) {
        std::string target = os::PathUtils::toWindowsPath(ocal::filesystem::getAbsolutePath(directory));
        m_session.setText(controls::kExportPathField, target);
        SLOG_INFO().message("Export directory set").context("directory", target);
    }

    auto started = std::filesystem::file_time_type::clock::now();
    if (m_session.exists(controls::kExportSaveButton)) {
        m_session.press(controls::kExportSaveButton);
    } else if (m_session.exists(controls::kDialogOkButton)) {
        m_session.press(controls::kDialogOkButton);
    } else {
        throw ControlResolutionError(controls::kExportSaveButton, "export dialog has neither save nor OK button");
    }

    if (m_session.exists(controls::kOverwriteConfirmButton)) {
        SLOG_DEBUG().message("Confirming overwrite of existing export");
        m_session.press(controls::kOverwriteConfirmButton);
    }
    return started;
}

} // namespace automation
} // namespace exportflow
