#ifndef EXPORTFLOW_CLIPBOARD_H
#define EXPORTFLOW_CLIPBOARD_H

#include <string>

namespace exportflow {
namespace ocal {
namespace clipboard {

/**
 * Destination of clipboard writes
 *
 * writeText replaces the whole clipboard content and throws
 * AutomationError(CLIPBOARD) when the clipboard cannot be written.
 */
class IClipboardWriter {
public:
    virtual ~IClipboardWriter() = default;
    virtual void writeText(const std::string& utf8Text) = 0;
};

// Process-wide system clipboard, stored as Unicode text
class SystemClipboard : public IClipboardWriter {
public:
    void writeText(const std::string& utf8Text) override;
};

/**
 * Set clipboard text content
 * @param text UTF-8 text to place on the clipboard
 * @return true if clipboard set successfully
 */
bool setClipboardText(const std::string& text);

} // namespace clipboard
} // namespace ocal
} // namespace exportflow

#endif // EXPORTFLOW_CLIPBOARD_H
