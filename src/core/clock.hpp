#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

/**
 * @brief Drift-free periodic clock for the monitor loop
 *
 * Tick k is scheduled at start + k * period. Sleep durations are computed
 * against that ideal schedule rather than against the loop body, so slow
 * iterations never accumulate drift.
 *
 * When a tick body overruns one or more whole periods, the missed slots are
 * skipped: the next wake is the first scheduled slot still in the future.
 * Missed ticks are counted but never replayed back-to-back.
 */
struct PeriodicClock {
    using clock = std::chrono::steady_clock;

    /// Idle hook called while waiting; must block for at most the given budget
    using IdleFn = std::function<void(std::chrono::milliseconds)>;

    std::chrono::nanoseconds period;
    clock::time_point next;
    std::uint64_t skipped{0};                       ///< Slots dropped after overruns
    std::chrono::milliseconds slice{100};           ///< Longest single wait before re-checking stop

    /**
     * @brief Construct a new Periodic Clock
     * @param p Period between clock ticks
     */
    explicit PeriodicClock(std::chrono::nanoseconds p)
        : period(p), next(clock::now() + p) {}

    /**
     * @brief Wait until the next scheduled tick
     *
     * Sleeps in bounded slices so a stop request is honoured promptly.
     * The idle hook, if given, replaces the plain sleep for each slice.
     *
     * @param running Loop flag; waiting ends early when it turns false
     * @param idle Optional hook that blocks for up to the slice budget
     * @return true if the tick time was reached, false if stopped
     */
    bool wait_next(const std::atomic<bool>& running, const IdleFn& idle = IdleFn()) {
        while (running.load(std::memory_order_relaxed)) {
            auto now = clock::now();
            if (now >= next) {
                advance(now);
                return true;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
            // round up so we never spin on a sub-millisecond remainder
            if (remaining.count() == 0) remaining = std::chrono::milliseconds(1);
            auto budget = std::min(remaining, slice);
            if (idle) {
                idle(budget);
            } else {
                std::this_thread::sleep_for(budget);
            }
        }
        return false;
    }

    /**
     * @brief Get the current period
     */
    std::chrono::nanoseconds get_period() const {
        return period;
    }

    /**
     * @brief Update the period and restart the schedule from now
     * @param new_period New period
     */
    void set_period(std::chrono::nanoseconds new_period) {
        period = new_period;
        next = clock::now() + period;
    }

    /**
     * @brief Get time until next scheduled wake
     * @return Duration until next wake time
     */
    std::chrono::nanoseconds time_to_next() const {
        auto now = clock::now();
        if (next <= now) {
            return std::chrono::nanoseconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(next - now);
    }

private:
    // Move the schedule to the first slot after `now`
    void advance(clock::time_point now) {
        next += period;
        if (next <= now) {
            auto behind = now - next;
            auto missed = behind / period + 1;
            skipped += static_cast<std::uint64_t>(missed);
            next += period * missed;
        }
    }
};
