#include "mouse_control.h"
#include "../common/os_utils.h"
#include "../common/structured_logger.h"
#include <thread>
#include <chrono>

namespace exportflow {
namespace ocal {
namespace mouse {

namespace {
    constexpr int kClickDelayMs = 20;
    constexpr int kDoubleClickIntervalMs = 60;
}

#ifdef _WIN32

bool clickAt(const Point& point, ClickType type) {
    if (!SetCursorPos(point.x, point.y)) {
        SLOG_ERROR().message("Failed to move cursor").context("x", point.x).context("y", point.y);
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    int clicks = (type == ClickType::DOUBLE) ? 2 : 1;
    for (int i = 0; i < clicks; ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kDoubleClickIntervalMs));
        }
        mouse_event(MOUSEEVENTF_LEFTDOWN, 0, 0, 0, 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(kClickDelayMs));
        mouse_event(MOUSEEVENTF_LEFTUP, 0, 0, 0, 0);
    }
    return true;
}

#else

bool clickAt(const Point& point, ClickType type) {
    (void)type;
    SLOG_ERROR().message("Pointer injection not available on this platform")
        .context("x", point.x)
        .context("y", point.y);
    return false;
}

#endif // _WIN32

} // namespace mouse
} // namespace ocal
} // namespace exportflow
