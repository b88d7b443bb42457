#ifndef EXPORTFLOW_CLOCK_H
#define EXPORTFLOW_CLOCK_H

#include <chrono>
#include <optional>
#include <algorithm>

namespace exportflow {

/**
 * @brief Time source for every wait in the automation core
 *
 * Production code uses SystemClock; tests substitute a clock that advances
 * virtual time on sleepFor so that timeouts elapse instantly.
 */
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual time_point now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public IClock {
public:
    static SystemClock& getInstance();

    time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

struct PollPolicy {
    std::chrono::milliseconds interval;
    std::chrono::milliseconds timeout;

    PollPolicy(std::chrono::milliseconds i, std::chrono::milliseconds t) : interval(i), timeout(t) {}
};

struct PollOutcome {
    bool satisfied;
    std::chrono::milliseconds elapsed;
};

/**
 * @brief Evaluates probe until it yields a value or the deadline passes
 *
 * The probe runs once immediately and once more at the deadline, so a
 * zero timeout still performs a single check. Sleeps never overshoot the
 * deadline.
 */
template<typename T, typename Probe>
std::optional<T> pollFor(IClock& clock, const PollPolicy& policy, Probe&& probe,
                         std::chrono::milliseconds* elapsedOut = nullptr) {
    const auto start = clock.now();
    const auto timeout = std::max(policy.timeout, std::chrono::milliseconds(0));
    const auto interval = std::max(policy.interval, std::chrono::milliseconds(1));
    const auto deadline = start + timeout;

    auto report = [&]() {
        if (elapsedOut) {
            *elapsedOut = std::chrono::duration_cast<std::chrono::milliseconds>(clock.now() - start);
        }
    };

    while (true) {
        std::optional<T> value = probe();
        if (value) {
            report();
            return value;
        }

        auto now = clock.now();
        if (now >= deadline) {
            report();
            return std::nullopt;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        clock.sleepFor(std::max(std::chrono::milliseconds(1), std::min(interval, remaining)));
    }
}

template<typename Predicate>
PollOutcome pollUntil(IClock& clock, const PollPolicy& policy, Predicate&& predicate) {
    std::chrono::milliseconds elapsed(0);
    auto hit = pollFor<bool>(clock, policy, [&]() -> std::optional<bool> {
        if (predicate()) {
            return true;
        }
        return std::nullopt;
    }, &elapsed);
    return PollOutcome{hit.has_value(), elapsed};
}

} // namespace exportflow

#endif // EXPORTFLOW_CLOCK_H
