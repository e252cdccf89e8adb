#pragma once
#include "../core/deadline.hpp"
#include "../core/sample.hpp"
#include "../hw/climate_sensor.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

/**
 * @brief Result of one SensorReader::read call
 *
 * Either a valid sample or an error state with its cause.
 */
struct Reading {
    Sample sample;
    ErrorState error{ErrorState::OK};
    std::string cause;

    bool ok() const { return error == ErrorState::OK; }

    static Reading success(const Sample& s) {
        Reading r;
        r.sample = s;
        return r;
    }

    static Reading failure(ErrorState e, std::string why) {
        Reading r;
        r.sample.timestamp = std::chrono::system_clock::now();
        r.error = e;
        r.cause = std::move(why);
        return r;
    }
};

/**
 * @brief Sensor read statistics for diagnostics
 */
struct ReadStatistics {
    std::uint64_t total_reads{0};
    std::uint64_t successful_reads{0};
    std::uint64_t error_count{0};
    std::uint64_t timeout_count{0};
    std::uint32_t consecutive_failures{0};
    double max_read_time_ms{0.0};

    void update_on_success(double read_time_ms) {
        total_reads++;
        successful_reads++;
        consecutive_failures = 0;
        if (read_time_ms > max_read_time_ms) max_read_time_ms = read_time_ms;
    }

    void update_on_error(ErrorState error_type) {
        total_reads++;
        error_count++;
        consecutive_failures++;
        if (error_type == ErrorState::TIMEOUT) timeout_count++;
    }
};

/**
 * @brief Turns the sensor capability into one Sample per call
 *
 * Calls the sensor exactly once per read(), bounded by a deadline, and
 * converts every driver fault into a failed Reading. No retries; the
 * monitor loop simply tries again on the next tick.
 */
class SensorReader {
private:
    std::shared_ptr<IClimateSensor> sensor_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<std::atomic<bool>> in_flight_{std::make_shared<std::atomic<bool>>(false)};
    ReadStatistics stats_;

public:
    /**
     * @param sensor Underlying capability; shared so a timed-out call can finish safely
     * @param timeout Upper bound on a single measurement
     */
    SensorReader(std::shared_ptr<IClimateSensor> sensor, std::chrono::milliseconds timeout)
        : sensor_(std::move(sensor)), timeout_(timeout) {}

    Reading read() {
        // a measurement abandoned at its deadline still owns the bus
        if (in_flight_->load()) {
            stats_.update_on_error(ErrorState::TIMEOUT);
            return Reading::failure(ErrorState::TIMEOUT, "previous sensor read still in progress");
        }

        auto start = std::chrono::steady_clock::now();
        auto sensor = sensor_;
        auto in_flight = in_flight_;
        in_flight->store(true);
        try {
            ClimateMeasurement m = call_with_deadline("sensor read", timeout_, [sensor, in_flight]() {
                struct Release {
                    std::atomic<bool>& flag;
                    ~Release() { flag.store(false); }
                } release{*in_flight};
                return sensor->measure();
            });
            auto end = std::chrono::steady_clock::now();
            stats_.update_on_success(std::chrono::duration<double, std::milli>(end - start).count());
            return Reading::success(Sample(std::chrono::system_clock::now(), m.temperature_c, m.humidity_pct));
        } catch (const SensorError& e) {
            stats_.update_on_error(e.state);
            return Reading::failure(e.state, e.what());
        } catch (const DeadlineExceeded& e) {
            stats_.update_on_error(ErrorState::TIMEOUT);
            return Reading::failure(ErrorState::TIMEOUT, e.what());
        } catch (const std::exception& e) {
            // also covers failing to start the helper thread
            in_flight->store(false);
            stats_.update_on_error(ErrorState::UNKNOWN_ERROR);
            return Reading::failure(ErrorState::UNKNOWN_ERROR, e.what());
        }
    }

    const ReadStatistics& get_statistics() const { return stats_; }

    /// A measurement abandoned at its deadline is still running
    bool read_in_flight() const { return in_flight_->load(); }

    /**
     * @brief Shut the sensor down unless an abandoned read still uses it
     * @return false if the read is still running; the device is then
     *         released by its last owner once that read returns
     */
    bool shutdown_sensor() {
        if (in_flight_->load()) return false;
        sensor_->shutdown();
        return true;
    }
};
