#pragma once
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * @brief One temperature/humidity sample taken by the monitor loop
 *
 * Produced once per tick by the SensorReader and never modified
 * afterwards; the evaluator, notifier and log store only read it.
 */
struct Sample {
    std::chrono::system_clock::time_point timestamp; ///< Wall-clock time of the reading
    double temperature_c{0.0};                      ///< Temperature in degrees Celsius
    double humidity_pct{0.0};                       ///< Relative humidity in %RH

    Sample() = default;

    Sample(std::chrono::system_clock::time_point ts, double t, double h)
        : timestamp(ts), temperature_c(t), humidity_pct(h) {}

    /**
     * @brief Format sample as human-readable string for debugging
     */
    std::string to_string() const {
        std::ostringstream os;
        os << std::fixed << std::setprecision(3)
           << "T=" << temperature_c << "C RH=" << humidity_pct << "%";
        return os.str();
    }
};

/**
 * @brief Monitored quantities
 */
enum class Metric : std::uint8_t {
    Temperature = 0,
    Humidity = 1,
};

constexpr std::size_t kMetricCount = 2;

inline std::size_t metric_index(Metric m) { return static_cast<std::size_t>(m); }

inline const char* metric_name(Metric m) {
    switch (m) {
        case Metric::Temperature: return "temperature";
        case Metric::Humidity: return "humidity";
    }
    return "unknown";
}

inline const char* metric_units(Metric m) {
    switch (m) {
        case Metric::Temperature: return "C";
        case Metric::Humidity: return "%";
    }
    return "";
}

/**
 * @brief Classification of one metric against its range
 */
enum class Status : std::uint8_t {
    Ok = 0,
    Below,
    Above,
};

inline const char* status_name(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::Below: return "below";
        case Status::Above: return "above";
    }
    return "unknown";
}

/**
 * @brief A sample together with its per-metric classification
 */
struct Evaluation {
    Sample sample;
    Status temp_status{Status::Ok};
    Status humidity_status{Status::Ok};

    Status status_of(Metric m) const {
        return m == Metric::Temperature ? temp_status : humidity_status;
    }

    double value_of(Metric m) const {
        return m == Metric::Temperature ? sample.temperature_c : sample.humidity_pct;
    }

    bool nominal() const {
        return temp_status == Status::Ok && humidity_status == Status::Ok;
    }
};
