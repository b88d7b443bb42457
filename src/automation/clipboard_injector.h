#ifndef EXPORTFLOW_CLIPBOARD_INJECTOR_H
#define EXPORTFLOW_CLIPBOARD_INJECTOR_H

#include <string>
#include "../common/types.h"
#include "../ocal/clipboard.h"

namespace exportflow {
namespace automation {

/**
 * @brief Places record identifiers on the clipboard for a bulk paste
 *
 * One identifier per line, CRLF separated, no trailing line ending.
 */
class ClipboardInjector {
public:
    explicit ClipboardInjector(ocal::clipboard::IClipboardWriter& writer);

    // Throws AutomationError(CLIPBOARD) when the clipboard cannot be written
    void write(const RecordIdList& ids);

    static std::string payload(const RecordIdList& ids);

private:
    ocal::clipboard::IClipboardWriter& m_writer;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_CLIPBOARD_INJECTOR_H
