#pragma once
#include "../core/sample.hpp"
#include "../core/timefmt.hpp"
#include "../hw/climate_sensor.hpp"
#include "notifier.hpp"
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

/**
 * @brief Kind of entry in the log store
 */
enum class LogEvent {
  Sample,       ///< Successful tick
  SensorError,  ///< Tick whose sensor read failed
  Start,        ///< Monitor started
  Stop,         ///< Monitor stopped on request
};

inline const char* log_event_name(LogEvent e) {
  switch (e) {
    case LogEvent::Sample: return "sample";
    case LogEvent::SensorError: return "sensor_error";
    case LogEvent::Start: return "start";
    case LogEvent::Stop: return "stop";
  }
  return "unknown";
}

/**
 * @brief One append-only log entry
 */
struct LogRecord {
  std::chrono::system_clock::time_point timestamp;
  LogEvent event{LogEvent::Sample};
  std::uint64_t tick{0};
  std::string room;
  std::optional<Evaluation> evaluation;   ///< Absent when the read failed
  NotificationOutcome notification;
  ErrorState sensor_error{ErrorState::OK};
  std::string sensor_cause;
  std::string message;                    ///< Free text for start/stop events
  bool overrun{false};                    ///< Tick body took longer than the interval
  std::uint64_t skipped_slots{0};         ///< Schedule slots dropped just before this tick

  /**
   * @brief Serialize as a single-line JSON object
   */
  nlohmann::json to_json() const {
    using json = nlohmann::json;
    json j;
    j["ts"] = timefmt::iso8601(timestamp);
    j["event"] = log_event_name(event);
    j["tick"] = tick;
    j["room"] = room;

    if (evaluation) {
      j["temperature_c"] = evaluation->sample.temperature_c;
      j["humidity_pct"] = evaluation->sample.humidity_pct;
      j["temp_status"] = status_name(evaluation->temp_status);
      j["humidity_status"] = status_name(evaluation->humidity_status);
    }
    if (event == LogEvent::SensorError) {
      j["sensor_error"] = {{"state", error_to_string(sensor_error)}, {"cause", sensor_cause}};
    }
    if (event == LogEvent::Sample || event == LogEvent::SensorError) {
      json notified = json::array();
      for (Metric m : notification.notified) notified.push_back(metric_name(m));
      if (notification.fault_notified) notified.push_back("sensor");
      json failed = json::array();
      for (Metric m : notification.failed_metrics) failed.push_back(metric_name(m));
      if (notification.fault_failed) failed.push_back("sensor");

      j["notification_sent"] = notification.sent;
      j["notified"] = notified;
      j["failed_metrics"] = failed;
      if (!notification.error.empty()) j["delivery_error"] = notification.error;
      j["overrun"] = overrun;
      j["skipped_slots"] = skipped_slots;
    }
    if (!message.empty()) j["message"] = message;
    return j;
  }
};

/**
 * @brief Durable, append-only, day-partitioned log store
 *
 * Layout: <root>/<YYYY>/<MM-YYYY>/<MM-DD-YYYY>.log, one JSON object per
 * line. Every record is written with a single write(2) on an O_APPEND
 * descriptor and flushed with fdatasync(2), so an interrupted write can
 * only leave a truncated last line. A truncated tail found when a file
 * is reopened is terminated before new records are appended.
 *
 * Failures are reported through record()'s return value and
 * last_error(); they never throw.
 */
class LogStore {
private:
  std::filesystem::path root_;
  int fd_{-1};
  int day_{0};
  std::filesystem::path current_path_;
  std::string last_error_;
  std::uint64_t records_written_{0};
  std::uint64_t failures_{0};

public:
  explicit LogStore(std::filesystem::path root) : root_(std::move(root)) {}

  ~LogStore() { close_file(); }

  LogStore(const LogStore&) = delete;
  LogStore& operator=(const LogStore&) = delete;

  /**
   * @brief Path of the day file for a point in time
   */
  std::filesystem::path path_for(std::chrono::system_clock::time_point tp) const {
    return root_ / timefmt::format(tp, "%Y") / timefmt::format(tp, "%m-%Y") /
           (timefmt::format(tp, "%m-%d-%Y") + ".log");
  }

  /**
   * @brief Append one record
   * @return false on failure; see last_error()
   */
  bool record(const LogRecord& entry) {
    if (!ensure_file(entry.timestamp)) {
      failures_++;
      return false;
    }

    std::string line = entry.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');

    if (!write_all(line)) {
      failures_++;
      // reopen on the next record in case the descriptor went bad
      close_file();
      return false;
    }
    if (::fdatasync(fd_) != 0) {
      last_error_ = "fdatasync " + current_path_.string() + ": " + std::strerror(errno);
      failures_++;
      return false;
    }
    records_written_++;
    return true;
  }

  const std::string& last_error() const { return last_error_; }
  std::uint64_t records_written() const { return records_written_; }
  std::uint64_t failures() const { return failures_; }
  const std::filesystem::path& current_path() const { return current_path_; }

private:
  bool ensure_file(std::chrono::system_clock::time_point tp) {
    int day = timefmt::day_key(tp);
    if (fd_ >= 0 && day == day_) return true;
    close_file();

    auto path = path_for(tp);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      last_error_ = "create " + path.parent_path().string() + ": " + ec.message();
      return false;
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      last_error_ = "open " + path.string() + ": " + std::strerror(errno);
      return false;
    }
    fd_ = fd;
    day_ = day;
    current_path_ = path;
    return terminate_partial_tail();
  }

  // A crash mid-write can leave a final line without its newline
  bool terminate_partial_tail() {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
      last_error_ = "fstat " + current_path_.string() + ": " + std::strerror(errno);
      close_file();
      return false;
    }
    if (st.st_size == 0) return true;

    int rfd = ::open(current_path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (rfd < 0) return true;  // write-only file; nothing to repair from here
    char last = '\n';
    ssize_t n = ::pread(rfd, &last, 1, st.st_size - 1);
    ::close(rfd);
    if (n == 1 && last != '\n') {
      if (!write_all("\n")) {
        close_file();
        return false;
      }
    }
    return true;
  }

  bool write_all(const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
      ssize_t n = ::write(fd_, p, left);
      if (n < 0) {
        if (errno == EINTR) continue;
        last_error_ = "write " + current_path_.string() + ": " + std::strerror(errno);
        return false;
      }
      p += n;
      left -= static_cast<size_t>(n);
    }
    return true;
  }

  void close_file() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    day_ = 0;
  }
};
