#include "clipboard_injector.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"

namespace exportflow {
namespace automation {

ClipboardInjector::ClipboardInjector(ocal::clipboard::IClipboardWriter& writer) : m_writer(writer) {}

std::string ClipboardInjector::payload(const RecordIdList& ids) {
    return utils::StringUtils::join(ids, "\r\n");
}

void ClipboardInjector::write(const RecordIdList& ids) {
    std::string text = payload(ids);
    try {
        m_writer.writeText(text);
    } catch (const AutomationError& e) {
        if (e.type() == ErrorType::CLIPBOARD) {
            throw;
        }
        throw AutomationError(ErrorType::CLIPBOARD, "Clipboard unavailable", e.what(), "clipboard");
    } catch (const std::exception& e) {
        throw AutomationError(ErrorType::CLIPBOARD, "Clipboard unavailable", e.what(), "clipboard");
    }

    SLOG_INFO().message("Identifiers copied to clipboard")
        .context("count", ids.size())
        .context("bytes", text.size());
}

} // namespace automation
} // namespace exportflow
