#pragma once
#include "../core/clock.hpp"
#include "../core/sample.hpp"
#include "../core/timefmt.hpp"
#include "../core/watchdog.hpp"
#include "config.hpp"
#include "evaluator.hpp"
#include "log_store.hpp"
#include "notifier.hpp"
#include "sensor_reader.hpp"
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Periodic sampling and alerting loop
 *
 * Each tick: wait for the next slot of the drift-free schedule, read the
 * sensor once, evaluate, let the notifier decide on e-mail, and append
 * one record to the log store. No fault after startup stops the loop;
 * only stop() (normally from a signal) ends run().
 *
 * - Single thread, ticks never overlap
 * - Overrunning ticks delay the next one, missed slots are skipped
 * - Optional status responder is served during the inter-tick wait
 */
struct MonitorLoop {
  const Config& config;      ///< Validated configuration
  SensorReader& reader;      ///< Sensor capability wrapper
  Notifier& notifier;        ///< Alert state owner
  LogStore& log;             ///< Durable record sink

  std::atomic<bool> running{true};      ///< Loop running flag
  std::chrono::nanoseconds period;      ///< Tick period
  Watchdog wd;                          ///< Tick overrun detection
  std::uint64_t tick_count{0};          ///< Ticks executed
  std::uint64_t skipped_ticks{0};       ///< Slots dropped after overruns
  std::uint64_t log_failures{0};        ///< Records that could not be stored
  std::optional<Sample> last_sample;    ///< Most recent successful reading
  bool verbose{true};                   ///< Echo each tick on stdout

  /**
   * @brief Constructor
   * @param cfg Validated configuration (must outlive the loop)
   * @param r Sensor reader
   * @param n Notifier
   * @param l Log store
   */
  MonitorLoop(const Config& cfg, SensorReader& r, Notifier& n, LogStore& l)
      : config(cfg), reader(r), notifier(n), log(l),
        period(std::chrono::duration_cast<std::chrono::nanoseconds>(cfg.interval())),
        wd(period) {
    wd.set_critical_callback([](const Watchdog& w) {
      std::cerr << "Monitor ticks overran their interval " << w.get_consecutive_overruns()
                << " times in a row" << std::endl;
    });
  }

  /**
   * @brief Run until stop() is called
   */
  void run() {
    run_with(PeriodicClock::IdleFn());
  }

  /**
   * @brief Run until stop() is called, serving status requests between ticks
   * @param rep Responder with poll(budget), recv() and reply(s)
   */
  template<class Rep>
  void run(Rep& rep) {
    run_with([this, &rep](std::chrono::milliseconds budget) {
      if (rep.poll(budget)) {
        rep.reply(handle_cmd(rep.recv()));
      }
    });
  }

  void stop() { running.store(false); }

  /**
   * @brief Execute one tick: read, evaluate, notify, record
   * @return The record that was (or failed to be) stored
   */
  LogRecord tick() {
    LogRecord rec = sample_once();
    store(rec);
    return rec;
  }

  /**
   * @brief Handle a JSON status request
   * @param s Request string
   * @return JSON response string
   */
  std::string handle_cmd(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (!j.is_object()) return "{\"ok\":false}";

    if (j["cmd"] == "ping") {
      return "{\"ok\":true}";
    } else if (j["cmd"] == "get_status") {
      const auto& st = reader.get_statistics();
      const auto& alerts = notifier.state();
      json status = {
        {"ok", true},
        {"room", config.room},
        {"tick", tick_count},
        {"interval_s", config.interval_seconds},
        {"alerting", {
          {"temperature", phase_name(alerts.of(Metric::Temperature).phase)},
          {"humidity", phase_name(alerts.of(Metric::Humidity).phase)},
          {"sensor", phase_name(alerts.sensor_fault.phase)}}},
        {"sensor_stats", {
          {"total_reads", st.total_reads},
          {"successful_reads", st.successful_reads},
          {"errors", st.error_count},
          {"timeouts", st.timeout_count},
          {"consecutive_failures", st.consecutive_failures},
          {"max_read_time_ms", st.max_read_time_ms}}},
        {"messages_sent", notifier.messages_sent()},
        {"delivery_failures", notifier.delivery_failures()},
        {"overruns", wd.get_total_overruns()},
        {"skipped_ticks", skipped_ticks},
        {"log_failures", log_failures}
      };
      if (last_sample) {
        status["last_sample"] = {
          {"temperature_c", last_sample->temperature_c},
          {"humidity_pct", last_sample->humidity_pct},
          {"ts", timefmt::iso8601(last_sample->timestamp)}};
      } else {
        status["last_sample"] = nullptr;
      }
      return status.dump();
    }
    return "{\"ok\":false}";
  }

private:
  void run_with(const PeriodicClock::IdleFn& idle) {
    PeriodicClock clk(period);
    wd.set_budget(period);
    store(lifecycle_record(LogEvent::Start, "monitoring started, interval " +
                                                std::to_string(config.interval_seconds) + " s"));

    while (running.load(std::memory_order_relaxed)) {
      const std::uint64_t skipped_before = clk.skipped;
      if (!clk.wait_next(running, idle)) break;

      auto start = std::chrono::steady_clock::now();
      LogRecord rec = sample_once();
      auto end = std::chrono::steady_clock::now();

      rec.skipped_slots = clk.skipped - skipped_before;
      rec.overrun = wd.check(start, end);
      if (rec.overrun) {
        std::cerr << "Tick " << tick_count << " took "
                  << std::fixed << std::setprecision(3)
                  << std::chrono::duration<double>(end - start).count()
                  << " s, longer than the "
                  << std::chrono::duration<double>(period).count() << " s interval" << std::endl;
      }
      if (rec.skipped_slots > 0) {
        std::cerr << "Skipped " << rec.skipped_slots << " schedule slot(s) before tick " << tick_count << std::endl;
      }
      skipped_ticks = clk.skipped;
      store(rec);
    }

    store(lifecycle_record(LogEvent::Stop, "monitoring stopped after " + std::to_string(tick_count) + " ticks"));
  }

  // Read, evaluate and notify; the caller stores the record
  LogRecord sample_once() {
    LogRecord rec;
    rec.tick = ++tick_count;
    rec.room = config.room;

    Reading r = reader.read();
    if (!r.ok()) {
      rec.event = LogEvent::SensorError;
      rec.timestamp = r.sample.timestamp;
      rec.sensor_error = r.error;
      rec.sensor_cause = r.cause;
      rec.notification = notifier.consider_fault(r.error, r.cause,
                                                 reader.get_statistics().consecutive_failures, config);
      std::cerr << "Sensor read failed (" << error_to_string(r.error) << "): " << r.cause << std::endl;
    } else {
      notifier.sensor_recovered();
      Evaluation ev = evaluate(r.sample, config);
      rec.timestamp = r.sample.timestamp;
      rec.evaluation = ev;
      rec.notification = notifier.consider(ev, config);
      last_sample = r.sample;
      if (verbose) {
        std::cout << "[" << timefmt::human(r.sample.timestamp) << "] " << r.sample.to_string()
                  << " temperature=" << status_name(ev.temp_status)
                  << " humidity=" << status_name(ev.humidity_status) << std::endl;
      }
    }

    report_notification(rec.notification);
    return rec;
  }

  LogRecord lifecycle_record(LogEvent ev, const std::string& message) const {
    LogRecord rec;
    rec.timestamp = std::chrono::system_clock::now();
    rec.event = ev;
    rec.tick = tick_count;
    rec.room = config.room;
    rec.message = message;
    return rec;
  }

  void report_notification(const NotificationOutcome& n) {
    if (n.sent) {
      std::cout << "Alert e-mailed to " << config.receivers.size() << " receiver(s)" << std::endl;
    }
    if (n.delivery_failed()) {
      std::cerr << "Alert delivery failed: " << n.error << std::endl;
    }
  }

  void store(const LogRecord& rec) {
    if (!log.record(rec)) {
      log_failures++;
      std::cerr << "Log store error: " << log.last_error() << std::endl;
    }
  }
};
