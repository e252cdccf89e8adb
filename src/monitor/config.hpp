#pragma once
#include "limits.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Invalid or unreadable configuration; fatal at startup
 */
struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * @brief Sensor driver selection and parameters
 */
struct SensorConfig {
  std::string driver{"sht4x"};     ///< "sht4x" or "simulated"
  std::string bus{"/dev/i2c-1"};   ///< i2c-dev node (sht4x)
  int address{0x44};               ///< 7-bit i2c address (sht4x)
  double base_temperature{22.0};   ///< Simulated mean temperature
  double base_humidity{45.0};      ///< Simulated mean humidity
  double noise{0.1};               ///< Simulated gaussian sigma
  double failure_rate{0.0};        ///< Simulated read failure probability [0,1]
  std::uint64_t seed{0};           ///< Simulated RNG seed (0 = random)
};

/**
 * @brief Monitor configuration, loaded once and immutable afterwards
 */
struct Config {
  std::string room;
  std::string sender;
  std::vector<std::string> receivers;
  Range temp_range;
  Range humidity_range;
  int interval_seconds{0};
  std::string log_root;

  SensorConfig sensor;
  std::vector<std::string> mailer{"/usr/sbin/sendmail", "-t", "-oi"};
  int sensor_timeout_ms{2000};
  int mail_timeout_ms{30000};
  int sensor_fault_alert_after{0};   ///< Consecutive failed reads before a fault alert, 0 = off
  std::string status_endpoint;       ///< ZeroMQ bind address, empty = disabled

  std::chrono::seconds interval() const { return std::chrono::seconds(interval_seconds); }
  std::chrono::milliseconds sensor_timeout() const { return std::chrono::milliseconds(sensor_timeout_ms); }
  std::chrono::milliseconds mail_timeout() const { return std::chrono::milliseconds(mail_timeout_ms); }

  /// Notifier wait per delivery; outlasts the mailer's own kill deadline
  std::chrono::milliseconds notify_timeout() const { return mail_timeout() + kNotifyMargin; }

  static constexpr std::chrono::milliseconds kNotifyMargin{1000};
};

/**
 * @brief Syntactic e-mail address check
 *
 * Accepts local@domain where local is non-empty, domain contains a dot
 * that is neither first nor last, there is exactly one '@' and no
 * whitespace or control characters anywhere.
 */
inline bool is_valid_email(const std::string& s) {
  auto at = s.find('@');
  if (at == std::string::npos || at == 0 || s.find('@', at + 1) != std::string::npos) return false;
  for (char c : s) {
    if (static_cast<unsigned char>(c) <= ' ' || c == 0x7f || c == '<' || c == '>' || c == ',') return false;
  }
  std::string domain = s.substr(at + 1);
  auto dot = domain.find('.');
  if (dot == std::string::npos || dot == 0 || domain.back() == '.') return false;
  return domain.find("..") == std::string::npos;
}

namespace config_detail {

using json = nlohmann::json;

inline const json& require(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw ConfigError(std::string("missing required field '") + key + "'");
  }
  return *it;
}

inline std::string require_string(const json& j, const char* key) {
  const json& v = require(j, key);
  if (!v.is_string() || v.get<std::string>().empty()) {
    throw ConfigError(std::string("'") + key + "' must be a non-empty string");
  }
  return v.get<std::string>();
}

inline Range parse_range(const json& j, const char* key) {
  const json& v = require(j, key);
  if (!v.is_array() || v.size() != 2 || !v[0].is_number() || !v[1].is_number()) {
    throw ConfigError(std::string("'") + key + "' must be a two-element [min, max] array of numbers");
  }
  Range r{v[0].get<double>(), v[1].get<double>()};
  if (!std::isfinite(r.min) || !std::isfinite(r.max)) {
    throw ConfigError(std::string("'") + key + "' bounds must be finite");
  }
  if (!r.valid()) {
    throw ConfigError(std::string("'") + key + "' has min greater than max");
  }
  return r;
}

inline int positive_int(const json& j, const char* key, int fallback) {
  auto it = j.find(key);
  if (it == j.end()) return fallback;
  if (!it->is_number_integer() || it->get<long long>() <= 0 || it->get<long long>() > INT32_MAX) {
    throw ConfigError(std::string("'") + key + "' must be a positive integer");
  }
  return it->get<int>();
}

inline SensorConfig parse_sensor(const json& j) {
  SensorConfig s;
  auto it = j.find("sensor");
  if (it == j.end()) return s;
  if (!it->is_object()) throw ConfigError("'sensor' must be an object");
  const json& o = *it;

  s.driver = o.value("driver", s.driver);
  if (s.driver != "sht4x" && s.driver != "simulated") {
    throw ConfigError("'sensor.driver' must be \"sht4x\" or \"simulated\"");
  }
  s.bus = o.value("bus", s.bus);
  s.address = o.value("address", s.address);
  if (s.address < 0x03 || s.address > 0x77) {
    throw ConfigError("'sensor.address' is not a valid 7-bit i2c address");
  }
  s.base_temperature = o.value("base_temperature", s.base_temperature);
  s.base_humidity = o.value("base_humidity", s.base_humidity);
  s.noise = o.value("noise", s.noise);
  s.failure_rate = o.value("failure_rate", s.failure_rate);
  if (s.noise < 0.0) throw ConfigError("'sensor.noise' must not be negative");
  if (s.failure_rate < 0.0 || s.failure_rate > 1.0) {
    throw ConfigError("'sensor.failure_rate' must be within [0, 1]");
  }
  s.seed = o.value("seed", s.seed);
  return s;
}

inline Config build(const json& j) {
  if (!j.is_object()) throw ConfigError("configuration must be a JSON object");

  Config c;
  c.log_root = require_string(j, "root_dir");
  c.room = require_string(j, "room");

  c.sender = require_string(j, "sender");
  if (!is_valid_email(c.sender)) {
    throw ConfigError("'sender' is not a valid e-mail address: " + c.sender);
  }

  const json& rcv = require(j, "receivers");
  if (!rcv.is_array() || rcv.empty()) {
    throw ConfigError("'receivers' must be a non-empty array");
  }
  for (const auto& r : rcv) {
    if (!r.is_string() || !is_valid_email(r.get<std::string>())) {
      throw ConfigError("'receivers' contains an invalid e-mail address: " + r.dump());
    }
    c.receivers.push_back(r.get<std::string>());
  }

  c.temp_range = parse_range(j, "temp_range");
  c.humidity_range = parse_range(j, "humidity_range");

  require(j, "interval");
  c.interval_seconds = positive_int(j, "interval", 0);

  c.sensor = parse_sensor(j);

  if (j.contains("mailer")) {
    const json& m = j["mailer"];
    if (!m.is_array() || m.empty()) throw ConfigError("'mailer' must be a non-empty array of strings");
    c.mailer.clear();
    for (const auto& arg : m) {
      if (!arg.is_string()) throw ConfigError("'mailer' must be a non-empty array of strings");
      c.mailer.push_back(arg.get<std::string>());
    }
    if (c.mailer.front().empty()) throw ConfigError("'mailer' program path is empty");
  }

  c.sensor_timeout_ms = positive_int(j, "sensor_timeout_ms", c.sensor_timeout_ms);
  c.mail_timeout_ms = positive_int(j, "mail_timeout_ms", c.mail_timeout_ms);

  if (j.contains("sensor_fault_alert_after")) {
    const json& f = j["sensor_fault_alert_after"];
    if (!f.is_number_integer() || f.get<long long>() < 0 || f.get<long long>() > INT32_MAX) {
      throw ConfigError("'sensor_fault_alert_after' must be a non-negative integer");
    }
    c.sensor_fault_alert_after = f.get<int>();
  }

  c.status_endpoint = j.value("status_endpoint", std::string());
  return c;
}

} // namespace config_detail

/**
 * @brief Build and validate a Config from parsed JSON
 * @throws ConfigError naming the offending field
 */
inline Config parse_config(const nlohmann::json& j) {
  try {
    return config_detail::build(j);
  } catch (const nlohmann::json::exception& e) {
    // wrong value type for an optional field
    throw ConfigError(std::string("malformed configuration: ") + e.what());
  }
}

/**
 * @brief Load configuration from a JSON file
 * @param path Path to config.json
 * @throws ConfigError if the file cannot be read, parsed or validated
 */
inline Config load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    throw ConfigError("configuration file '" + path + "' is not valid JSON");
  }
  return parse_config(j);
}
