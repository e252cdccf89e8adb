#include <iostream>
#include <signal.h>
#include <atomic>
#include <memory>
#include <string>

#include "hw/sht4x.hpp"
#include "hw/sim_climate.hpp"
#include "monitor/config.hpp"
#include "monitor/log_store.hpp"
#include "monitor/loop.hpp"
#include "monitor/mailer.hpp"
#include "monitor/notifier.hpp"
#include "monitor/sensor_reader.hpp"
#include "ipc/status_rep.hpp"

namespace {

// Exit statuses
constexpr int kExitOk = 0;
constexpr int kExitStartupFailure = 1;
constexpr int kExitConfigError = 2;

// Loop to stop on SIGINT/SIGTERM; lock-free atomic store is signal-safe
std::atomic<bool>* g_running = nullptr;

void signal_handler(int) {
    if (g_running) g_running->store(false);
}

std::shared_ptr<IClimateSensor> make_sensor(const SensorConfig& sc) {
    if (sc.driver == "simulated") {
        return std::make_shared<SimulatedClimateSensor>(sc.base_temperature, sc.base_humidity,
                                                        sc.noise, sc.failure_rate, sc.seed);
    }
    return std::make_shared<SHT4x>(sc.bus, static_cast<std::uint8_t>(sc.address));
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.json]" << std::endl;
        return kExitConfigError;
    }
    const std::string config_path = argc == 2 ? argv[1] : "config.json";

    Config config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitConfigError;
    }

    std::cout << "Room monitor - starting up for room " << config.room << "..." << std::endl;

    try {
        auto sensor = make_sensor(config.sensor);
        if (!sensor->initialize()) {
            // not fatal: every tick retries and logs the failure until the device answers
            std::cerr << "Sensor " << sensor->get_type_name() << " " << sensor->get_id()
                      << " unavailable at startup, retrying on each tick" << std::endl;
        } else {
            std::cout << "Sensor: " << sensor->get_type_name() << " " << sensor->get_id() << std::endl;
        }

        SensorReader reader(sensor, config.sensor_timeout());
        auto mailer = std::make_shared<SendmailMailer>(config.mailer, config.mail_timeout());
        Notifier notifier(mailer, config.notify_timeout());
        LogStore log(config.log_root);

        MonitorLoop loop(config, reader, notifier, log);

        g_running = &loop.running;
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        std::cout << "Sampling every " << config.interval_seconds << " s, logging under "
                  << config.log_root << std::endl;
        std::cout << "Temperature range: [" << config.temp_range.min << ", " << config.temp_range.max
                  << "] C, humidity range: [" << config.humidity_range.min << ", "
                  << config.humidity_range.max << "] %" << std::endl;

        if (!config.status_endpoint.empty()) {
            StatusRep status(config.status_endpoint);
            std::cout << "Status responder bound to: " << status.get_bind_address() << std::endl;
            loop.run(status);
        } else {
            loop.run();
        }

        g_running = nullptr;
        if (!reader.shutdown_sensor()) {
            std::cerr << "Sensor read still in progress, device closes when it returns" << std::endl;
        }

        std::cout << "Shutdown complete after " << loop.tick_count << " ticks ("
                  << notifier.messages_sent() << " alerts sent, "
                  << reader.get_statistics().error_count << " sensor errors)." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return kExitStartupFailure;
    }

    return kExitOk;
}
