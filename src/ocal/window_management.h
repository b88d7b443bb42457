#ifndef EXPORTFLOW_WINDOW_MANAGEMENT_H
#define EXPORTFLOW_WINDOW_MANAGEMENT_H

#include <string>
#include <vector>

namespace exportflow {
namespace ocal {
namespace window {

using WindowHandle = void*; // HWND on Windows
constexpr WindowHandle INVALID_WINDOW_HANDLE = nullptr;

struct WindowInfo {
    WindowHandle handle;
    std::string title;
    unsigned long processId;
    bool isVisible;

    WindowInfo() : handle(INVALID_WINDOW_HANDLE), processId(0), isVisible(false) {}
};

/**
 * Whether a window title matches a pattern anchored at the title start
 *
 * The pattern is an ECMAScript regular expression; "SAP Logon.*" matches
 * "SAP Logon 770" but not "Old SAP Logon". An invalid pattern matches nothing.
 */
bool titleMatches(const std::string& pattern, const std::string& title);

// Visible top-level windows; empty on platforms without a window manager binding
std::vector<WindowInfo> enumerateVisible();

// First visible top-level window whose title matches the pattern
WindowHandle findByTitlePattern(const std::string& pattern);

bool bringToFront(WindowHandle handle);

} // namespace window
} // namespace ocal
} // namespace exportflow

#endif // EXPORTFLOW_WINDOW_MANAGEMENT_H
