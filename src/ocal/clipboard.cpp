#include "clipboard.h"
#include "../common/os_utils.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <cstring>
#include <chrono>
#include <thread>

namespace exportflow {
namespace ocal {
namespace clipboard {

#ifdef _WIN32

namespace {

// Another process may hold the clipboard open for a short while
bool openClipboardWithRetry() {
    for (int attempt = 0; attempt < 10; ++attempt) {
        if (OpenClipboard(NULL)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

} // anonymous namespace

bool setClipboardText(const std::string& text) {
    if (!openClipboardWithRetry()) {
        SLOG_ERROR().message("Failed to open clipboard").context("error", static_cast<unsigned long>(GetLastError()));
        return false;
    }

    EmptyClipboard();

    std::wstring wText = os::UnicodeUtils::utf8ToWideString(text);
    size_t len = (wText.length() + 1) * sizeof(wchar_t);
    HGLOBAL hMem = GlobalAlloc(GMEM_MOVEABLE, len);
    if (!hMem) {
        CloseClipboard();
        SLOG_ERROR().message("Failed to allocate clipboard memory").context("bytes", len);
        return false;
    }

    void* locked = GlobalLock(hMem);
    if (!locked) {
        GlobalFree(hMem);
        CloseClipboard();
        SLOG_ERROR().message("Failed to lock clipboard memory");
        return false;
    }
    std::memcpy(locked, wText.c_str(), len);
    GlobalUnlock(hMem);

    if (!SetClipboardData(CF_UNICODETEXT, hMem)) {
        // Ownership stays with us when SetClipboardData fails
        GlobalFree(hMem);
        CloseClipboard();
        SLOG_ERROR().message("Failed to set clipboard data").context("error", static_cast<unsigned long>(GetLastError()));
        return false;
    }

    CloseClipboard();
    SLOG_DEBUG().message("Set clipboard text").context("length", text.length());
    return true;
}

#else

bool setClipboardText(const std::string& text) {
    SLOG_ERROR().message("No system clipboard available on this platform").context("length", text.length());
    return false;
}

#endif // _WIN32

void SystemClipboard::writeText(const std::string& utf8Text) {
    if (!setClipboardText(utf8Text)) {
        throw AutomationError(ErrorType::CLIPBOARD, "Clipboard unavailable",
                              "system clipboard rejected the write", "clipboard");
    }
}

} // namespace clipboard
} // namespace ocal
} // namespace exportflow
