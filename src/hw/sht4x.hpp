#pragma once
#include "climate_sensor.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

/**
 * @brief Sensirion SHT4x temperature/humidity sensor on Linux i2c-dev
 *
 * Uses the high-repeatability single-shot measurement (command 0xFD):
 * write the command, wait for the conversion, read two 16-bit words each
 * followed by a CRC-8 byte.
 *
 * Conversion (datasheet):
 *   T  = -45 + 175 * raw / 65535  [degC]
 *   RH =  -6 + 125 * raw / 65535  [%RH], clamped to [0, 100]
 */
class SHT4x : public IClimateSensor {
public:
    static constexpr std::uint8_t kDefaultAddress = 0x44;
    static constexpr std::uint8_t kCmdMeasureHighPrecision = 0xFD;
    static constexpr std::uint8_t kCmdSoftReset = 0x94;
    static constexpr std::uint8_t kCrcPoly = 0x31;
    static constexpr std::uint8_t kCrcInit = 0xFF;
    static constexpr std::chrono::milliseconds kMeasureDelay{10};  ///< 8.3 ms max + margin

private:
    std::string bus_path_;
    std::uint8_t address_;
    int fd_{-1};
    std::string last_open_error_;

public:
    /**
     * @brief Construct driver for a device on an i2c bus
     * @param bus_path i2c-dev node, e.g. /dev/i2c-1
     * @param address 7-bit device address (0x44 or 0x45)
     */
    explicit SHT4x(std::string bus_path = "/dev/i2c-1", std::uint8_t address = kDefaultAddress)
        : bus_path_(std::move(bus_path)), address_(address) {
        sensor_id_ = bus_path_ + "@0x" + hex_byte(address_);
    }

    ~SHT4x() override { shutdown(); }

    SHT4x(const SHT4x&) = delete;
    SHT4x& operator=(const SHT4x&) = delete;

    /**
     * @brief Open the bus and select the device
     * @return false if the bus node cannot be opened or the address selected
     */
    bool initialize() override {
        shutdown();
        ErrorState state = ErrorState::OK;
        return open_bus(state, last_open_error_);
    }

    /**
     * @brief Why the last attempt to open the bus failed (empty after success)
     */
    const std::string& last_open_error() const { return last_open_error_; }

    void shutdown() override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        initialized_ = false;
    }

    /**
     * @brief Take one measurement, reopening the bus first if it is closed
     *
     * A bus that was missing at startup, or dropped after a transfer error,
     * is retried here so the device comes back on its own.
     */
    ClimateMeasurement measure() override {
        if (fd_ < 0) {
            ErrorState state = ErrorState::OK;
            if (!open_bus(state, last_open_error_)) {
                throw SensorError(state, last_open_error_);
            }
        }

        const std::uint8_t cmd = kCmdMeasureHighPrecision;
        if (::write(fd_, &cmd, 1) != 1) {
            std::string why = std::strerror(errno);
            shutdown();
            throw SensorError(ErrorState::COMMUNICATION_ERROR,
                              "SHT4x " + sensor_id_ + " command write failed: " + why);
        }

        std::this_thread::sleep_for(kMeasureDelay);

        std::array<std::uint8_t, 6> buf{};
        ssize_t n = ::read(fd_, buf.data(), buf.size());
        if (n != static_cast<ssize_t>(buf.size())) {
            std::string why = n < 0 ? std::strerror(errno) : "device returned too few bytes";
            shutdown();
            throw SensorError(ErrorState::COMMUNICATION_ERROR,
                              "SHT4x " + sensor_id_ + " short read (" + std::to_string(n) + " bytes): " + why);
        }
        return decode(buf);
    }

    std::string get_type_name() const override { return "SHT4x"; }

    /**
     * @brief Sensirion CRC-8 (poly 0x31, init 0xFF, no reflection)
     */
    static std::uint8_t crc8(const std::uint8_t* data, std::size_t len) {
        std::uint8_t crc = kCrcInit;
        for (std::size_t i = 0; i < len; ++i) {
            crc ^= data[i];
            for (int bit = 0; bit < 8; ++bit) {
                if (crc & 0x80) {
                    crc = static_cast<std::uint8_t>((crc << 1) ^ kCrcPoly);
                } else {
                    crc = static_cast<std::uint8_t>(crc << 1);
                }
            }
        }
        return crc;
    }

    static double convert_temperature(std::uint16_t raw) {
        return -45.0 + 175.0 * static_cast<double>(raw) / 65535.0;
    }

    static double convert_humidity(std::uint16_t raw) {
        double rh = -6.0 + 125.0 * static_cast<double>(raw) / 65535.0;
        if (rh < 0.0) return 0.0;
        if (rh > 100.0) return 100.0;
        return rh;
    }

    /**
     * @brief Verify and convert a 6-byte measurement frame
     * @throws SensorError(CHECKSUM_ERROR) if either word fails its CRC
     */
    static ClimateMeasurement decode(const std::array<std::uint8_t, 6>& buf) {
        if (crc8(&buf[0], 2) != buf[2]) {
            throw SensorError(ErrorState::CHECKSUM_ERROR, "SHT4x CRC mismatch (temperature)");
        }
        if (crc8(&buf[3], 2) != buf[5]) {
            throw SensorError(ErrorState::CHECKSUM_ERROR, "SHT4x CRC mismatch (humidity)");
        }
        auto raw_t = static_cast<std::uint16_t>((buf[0] << 8) | buf[1]);
        auto raw_rh = static_cast<std::uint16_t>((buf[3] << 8) | buf[4]);

        ClimateMeasurement m;
        m.temperature_c = convert_temperature(raw_t);
        m.humidity_pct = convert_humidity(raw_rh);
        return m;
    }

private:
    // Open the bus node, select the device and soft-reset it
    bool open_bus(ErrorState& state, std::string& why) {
        int fd = ::open(bus_path_.c_str(), O_RDWR | O_CLOEXEC);
        if (fd < 0) {
            state = ErrorState::HARDWARE_FAULT;
            why = "SHT4x " + sensor_id_ + " cannot open " + bus_path_ + ": " + std::strerror(errno);
            return false;
        }
        if (::ioctl(fd, I2C_SLAVE, static_cast<unsigned long>(address_)) < 0) {
            state = ErrorState::COMMUNICATION_ERROR;
            why = "SHT4x " + sensor_id_ + " cannot select address: " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        // adapter timeout in units of 10 ms; adapters without support keep their default
        (void)::ioctl(fd, I2C_TIMEOUT, 10UL);
        fd_ = fd;
        soft_reset();
        initialized_ = true;
        why.clear();
        return true;
    }

    void soft_reset() {
        const std::uint8_t cmd = kCmdSoftReset;
        if (::write(fd_, &cmd, 1) == 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    static std::string hex_byte(std::uint8_t v) {
        static const char* digits = "0123456789abcdef";
        std::string s;
        s += digits[v >> 4];
        s += digits[v & 0x0F];
        return s;
    }
};
