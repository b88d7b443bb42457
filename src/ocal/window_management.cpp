#include "window_management.h"
#include "../common/os_utils.h"
#include "../common/structured_logger.h"
#include <regex>

namespace exportflow {
namespace ocal {
namespace window {

bool titleMatches(const std::string& pattern, const std::string& title) {
    try {
        std::regex expression(pattern);
        return std::regex_search(title, expression, std::regex_constants::match_continuous);
    } catch (const std::regex_error& e) {
        SLOG_WARNING().message("Invalid window title pattern").context("pattern", pattern).context("error", e.what());
        return false;
    }
}

#ifdef _WIN32

namespace {

BOOL CALLBACK enumWindowsProc(HWND hwnd, LPARAM lParam) {
    auto* windows = reinterpret_cast<std::vector<WindowInfo>*>(lParam);
    if (!IsWindowVisible(hwnd)) {
        return TRUE;
    }

    WindowInfo info;
    info.handle = hwnd;
    info.isVisible = true;

    wchar_t title[512];
    int length = GetWindowTextW(hwnd, title, sizeof(title) / sizeof(wchar_t));
    info.title = os::UnicodeUtils::wideStringToUtf8(std::wstring(title, length > 0 ? length : 0));

    DWORD processId = 0;
    GetWindowThreadProcessId(hwnd, &processId);
    info.processId = processId;

    windows->push_back(info);
    return TRUE;
}

} // anonymous namespace

std::vector<WindowInfo> enumerateVisible() {
    std::vector<WindowInfo> windows;
    EnumWindows(enumWindowsProc, reinterpret_cast<LPARAM>(&windows));
    return windows;
}

bool bringToFront(WindowHandle handle) {
    if (!handle) {
        return false;
    }

    HWND hwnd = static_cast<HWND>(handle);
    if (IsIconic(hwnd)) {
        ShowWindow(hwnd, SW_RESTORE);
    }
    if (SetForegroundWindow(hwnd)) {
        return true;
    }

    // Foreground lock: attach to the foreground thread and retry
    SetWindowPos(hwnd, HWND_TOP, 0, 0, 0, 0, SWP_NOMOVE | SWP_NOSIZE | SWP_SHOWWINDOW);
    HWND foregroundWindow = GetForegroundWindow();
    DWORD foregroundThreadId = GetWindowThreadProcessId(foregroundWindow, nullptr);
    DWORD currentThreadId = GetCurrentThreadId();
    BOOL result = FALSE;
    if (foregroundThreadId != currentThreadId) {
        AttachThreadInput(currentThreadId, foregroundThreadId, TRUE);
        result = SetForegroundWindow(hwnd);
        AttachThreadInput(currentThreadId, foregroundThreadId, FALSE);
    } else {
        result = SetForegroundWindow(hwnd);
    }

    if (!result) {
        SLOG_WARNING().message("Could not bring window to front");
    }
    return result != FALSE;
}

#else

std::vector<WindowInfo> enumerateVisible() {
    return {};
}

bool bringToFront(WindowHandle handle) {
    (void)handle;
    return false;
}

#endif // _WIN32

WindowHandle findByTitlePattern(const std::string& pattern) {
    for (const auto& window : enumerateVisible()) {
        if (titleMatches(pattern, window.title)) {
            SLOG_DEBUG().message("Found window by title pattern")
                .context("pattern", pattern)
                .context("title", window.title);
            return window.handle;
        }
    }
    return INVALID_WINDOW_HANDLE;
}

} // namespace window
} // namespace ocal
} // namespace exportflow
