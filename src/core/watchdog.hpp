#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>

/**
 * @brief Tick overrun watchdog for the monitor loop
 *
 * Compares the execution time of each tick body against the tick budget
 * (normally the sampling interval). A tick that takes longer than its
 * budget delays the next scheduled tick; the watchdog makes that visible.
 *
 * Features:
 * - Overrun detection against a fixed budget
 * - Consecutive overrun counting with a critical threshold
 * - Min / max / mean tick duration statistics
 * - Optional callback when the critical threshold is reached
 *
 * Used from the single loop thread only.
 */
class Watchdog {
private:
    std::chrono::nanoseconds budget;             ///< Allowed tick execution time
    std::chrono::nanoseconds warning_threshold;  ///< Warning level (fraction of budget)
    double warning_ratio;

    bool tripped{false};                         ///< Last check overran
    std::uint32_t consecutive_overruns{0};
    std::uint64_t total_overruns{0};
    std::uint64_t total_warnings{0};
    std::uint64_t total_checks{0};

    std::uint64_t min_execution_ns{std::numeric_limits<std::uint64_t>::max()};
    std::uint64_t max_execution_ns{0};
    std::uint64_t sum_execution_ns{0};

    std::uint32_t critical_consecutive_threshold{3};

    std::function<void(const Watchdog&)> critical_callback;

public:
    /**
     * @brief Construct watchdog with time budget
     * @param budget_ns Maximum allowed tick duration
     * @param warning_ratio Warning threshold as fraction of budget (default: 0.8)
     */
    explicit Watchdog(std::chrono::nanoseconds budget_ns, double warning_ratio = 0.8)
        : budget(budget_ns)
        , warning_threshold(static_cast<std::chrono::nanoseconds::rep>(budget_ns.count() * warning_ratio))
        , warning_ratio(warning_ratio)
    {}

    /**
     * @brief Change the budget, keeping the warning ratio and statistics
     */
    void set_budget(std::chrono::nanoseconds budget_ns) {
        budget = budget_ns;
        warning_threshold = std::chrono::nanoseconds(
            static_cast<std::chrono::nanoseconds::rep>(budget_ns.count() * warning_ratio));
    }

    /**
     * @brief Check a tick against the budget
     * @param start_time Tick start
     * @param end_time Tick end
     * @return true if the tick overran its budget
     */
    template<typename TimePoint>
    bool check(TimePoint start_time, TimePoint end_time) {
        auto execution_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
        return check_duration(execution_ns);
    }

    /**
     * @brief Check a measured tick duration against the budget
     * @param execution_time Duration of the tick body
     * @return true if the tick overran its budget
     */
    bool check_duration(std::chrono::nanoseconds execution_time) {
        total_checks++;
        update_statistics(execution_time);

        tripped = execution_time > budget;
        if (tripped) {
            total_overruns++;
            consecutive_overruns++;
            if (consecutive_overruns == critical_consecutive_threshold && critical_callback) {
                critical_callback(*this);
            }
        } else {
            consecutive_overruns = 0;
        }

        if (execution_time > warning_threshold) {
            total_warnings++;
        }
        return tripped;
    }

    void set_critical_threshold(std::uint32_t threshold) { critical_consecutive_threshold = threshold; }

    void set_critical_callback(std::function<void(const Watchdog&)> callback) {
        critical_callback = std::move(callback);
    }

    bool is_tripped() const { return tripped; }
    bool is_critical() const { return consecutive_overruns >= critical_consecutive_threshold; }
    std::uint32_t get_consecutive_overruns() const { return consecutive_overruns; }
    std::uint64_t get_total_overruns() const { return total_overruns; }
    std::uint64_t get_total_warnings() const { return total_warnings; }
    std::uint64_t get_total_checks() const { return total_checks; }
    std::chrono::nanoseconds get_budget() const { return budget; }

    /**
     * @brief Get mean tick duration in nanoseconds
     */
    double get_mean_execution_ns() const {
        if (total_checks == 0) return 0.0;
        return static_cast<double>(sum_execution_ns) / total_checks;
    }

    std::uint64_t get_min_execution_ns() const {
        return total_checks == 0 ? 0 : min_execution_ns;
    }

    std::uint64_t get_max_execution_ns() const { return max_execution_ns; }

private:
    void update_statistics(std::chrono::nanoseconds execution_time) {
        auto exec_ns = static_cast<std::uint64_t>(execution_time.count() < 0 ? 0 : execution_time.count());
        if (exec_ns < min_execution_ns) min_execution_ns = exec_ns;
        if (exec_ns > max_execution_ns) max_execution_ns = exec_ns;
        sum_execution_ns += exec_ns;
    }
};
