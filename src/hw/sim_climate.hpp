#pragma once
#include "climate_sensor.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>

/**
 * @brief Simulated temperature/humidity sensor for bench runs
 *
 * Produces base values plus gaussian noise and can inject read failures,
 * either randomly (failure_rate) or deterministically via fail_next().
 */
class SimulatedClimateSensor : public IClimateSensor {
private:
    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_{0.0, 1.0};
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};

    double temperature_;
    double humidity_;
    double noise_;
    double failure_rate_;
    int forced_failures_{0};
    std::uint64_t reads_{0};

public:
    /**
     * @param temperature Mean temperature in degC
     * @param humidity Mean relative humidity in %RH
     * @param noise Gaussian standard deviation applied to both values
     * @param failure_rate Probability of a simulated bus error per read
     * @param seed Random seed (0 = use random device)
     */
    SimulatedClimateSensor(double temperature = 22.0, double humidity = 45.0,
                           double noise = 0.0, double failure_rate = 0.0,
                           std::uint64_t seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed)
        , temperature_(temperature)
        , humidity_(humidity)
        , noise_(noise)
        , failure_rate_(failure_rate) {
        sensor_id_ = "SIM";
    }

    ClimateMeasurement measure() override {
        reads_++;
        if (forced_failures_ > 0) {
            forced_failures_--;
            throw SensorError(ErrorState::COMMUNICATION_ERROR, "simulated bus error");
        }
        if (failure_rate_ > 0.0 && uniform_(rng_) < failure_rate_) {
            throw SensorError(ErrorState::COMMUNICATION_ERROR, "simulated bus error");
        }

        ClimateMeasurement m;
        m.temperature_c = temperature_ + noise_ * normal_(rng_);
        m.humidity_pct = std::min(100.0, std::max(0.0, humidity_ + noise_ * normal_(rng_)));
        return m;
    }

    std::string get_type_name() const override { return "SimulatedClimateSensor"; }

    void set_conditions(double temperature, double humidity) {
        temperature_ = temperature;
        humidity_ = humidity;
    }

    void fail_next(int count) { forced_failures_ = count; }

    std::uint64_t read_count() const { return reads_; }
};
