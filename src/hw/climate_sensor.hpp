#pragma once
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Sensor error states
 */
enum class ErrorState {
    OK = 0,                    ///< Normal operation
    TIMEOUT,                   ///< Read did not complete before its deadline
    COMMUNICATION_ERROR,       ///< Bus transfer with the device failed
    CHECKSUM_ERROR,            ///< Data word failed its CRC
    OUT_OF_RANGE,              ///< Converted value outside the device's physical range
    HARDWARE_FAULT,            ///< Device missing or malfunctioning
    NOT_INITIALIZED,           ///< Sensor not properly initialized
    UNKNOWN_ERROR              ///< Unspecified error condition
};

/**
 * @brief Convert error state to human-readable string
 */
inline const char* error_to_string(ErrorState error) {
    switch (error) {
        case ErrorState::OK: return "OK";
        case ErrorState::TIMEOUT: return "TIMEOUT";
        case ErrorState::COMMUNICATION_ERROR: return "COMMUNICATION_ERROR";
        case ErrorState::CHECKSUM_ERROR: return "CHECKSUM_ERROR";
        case ErrorState::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorState::HARDWARE_FAULT: return "HARDWARE_FAULT";
        case ErrorState::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case ErrorState::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
    }
    return "INVALID_ERROR_STATE";
}

/**
 * @brief Driver-level sensor fault
 */
struct SensorError : std::runtime_error {
    ErrorState state;

    SensorError(ErrorState s, const std::string& cause)
        : std::runtime_error(cause), state(s) {}
};

/**
 * @brief Raw result of one climate measurement
 */
struct ClimateMeasurement {
    double temperature_c{0.0};
    double humidity_pct{0.0};
};

/**
 * @brief Abstract temperature/humidity sensor
 *
 * One call to measure() performs exactly one hardware measurement.
 * Failures are reported by throwing SensorError; implementations do not
 * retry internally.
 */
class IClimateSensor {
protected:
    std::string sensor_id_;        ///< Unique sensor identifier
    bool initialized_{false};      ///< Initialization state

public:
    virtual ~IClimateSensor() = default;

    /**
     * @brief Take one measurement
     * @throws SensorError on any bus, checksum or range fault
     */
    virtual ClimateMeasurement measure() = 0;

    /**
     * @brief Initialize sensor hardware
     * @return true if initialization successful
     */
    virtual bool initialize() {
        initialized_ = true;
        return true;
    }

    /**
     * @brief Release hardware resources
     */
    virtual void shutdown() {
        initialized_ = false;
    }

    virtual bool is_initialized() const { return initialized_; }

    virtual std::string get_id() const { return sensor_id_; }

    virtual void set_id(const std::string& id) { sensor_id_ = id; }

    /**
     * @brief Get sensor type name (for logging)
     */
    virtual std::string get_type_name() const = 0;
};
