#include "clock.h"
#include <thread>

namespace exportflow {

SystemClock& SystemClock::getInstance() {
    static SystemClock instance;
    return instance;
}

SystemClock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

} // namespace exportflow
