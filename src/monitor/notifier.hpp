#pragma once
#include "../core/deadline.hpp"
#include "../core/sample.hpp"
#include "../core/timefmt.hpp"
#include "../hw/climate_sensor.hpp"
#include "config.hpp"
#include "evaluator.hpp"
#include "mailer.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Alerting phase of one monitored condition
 */
enum class AlertPhase {
  Normal,    ///< In range; next breach notifies
  Alerting,  ///< Episode in progress; repeats suppressed
};

inline const char* phase_name(AlertPhase p) {
  return p == AlertPhase::Normal ? "normal" : "alerting";
}

/**
 * @brief Alert state of one condition
 *
 * last_notified_at stays empty while an episode's alert has not been
 * delivered yet, which makes the next qualifying tick retry it.
 */
struct ConditionState {
  AlertPhase phase{AlertPhase::Normal};
  std::optional<std::chrono::system_clock::time_point> last_notified_at;
};

/**
 * @brief Complete alert state owned by one Notifier
 */
struct AlertState {
  std::array<ConditionState, kMetricCount> metrics{};
  ConditionState sensor_fault{};

  ConditionState& of(Metric m) { return metrics[metric_index(m)]; }
  const ConditionState& of(Metric m) const { return metrics[metric_index(m)]; }
};

/**
 * @brief Fixed suppression policy
 *
 * renotify_after == 0 means one e-mail per episode no matter how long
 * the episode lasts.
 */
struct AlertPolicy {
  std::chrono::seconds renotify_after{0};
};

/**
 * @brief What a Notifier call did, for the caller to log
 */
struct NotificationOutcome {
  bool sent{false};                    ///< A message was delivered
  std::vector<Metric> notified;        ///< Metrics included in a delivered message
  std::vector<Metric> failed_metrics;  ///< Metrics whose message failed to deliver
  bool fault_notified{false};          ///< Sensor fault alert delivered
  bool fault_failed{false};            ///< Sensor fault alert failed to deliver
  std::string error;                   ///< Delivery error text, empty on success

  bool delivery_failed() const { return !failed_metrics.empty() || fault_failed; }
};

/**
 * @brief Threshold alert dispatcher with per-condition suppression
 *
 * Each metric runs an explicit two-state machine:
 *
 *   Normal   --(status != ok)--> Alerting   notify
 *   Alerting --(status != ok)--> Alerting   suppressed (retry if undelivered,
 *                                           or renotify after the cooldown)
 *   Alerting --(status == ok)--> Normal     silent
 *
 * All metrics due on one sample are sent as a single message. The same
 * machine, driven by consecutive failed reads, covers sensor fault alerts.
 */
class Notifier {
private:
  std::shared_ptr<IMailer> mailer_;
  std::chrono::milliseconds timeout_;
  AlertPolicy policy_;
  AlertState state_;
  std::uint64_t messages_sent_{0};
  std::uint64_t delivery_failures_{0};

public:
  /**
   * @param mailer E-mail capability
   * @param timeout Upper bound on one delivery attempt
   * @param policy Suppression policy
   */
  Notifier(std::shared_ptr<IMailer> mailer, std::chrono::milliseconds timeout, AlertPolicy policy = AlertPolicy{})
      : mailer_(std::move(mailer)), timeout_(timeout), policy_(policy) {}

  /**
   * @brief Advance the per-metric state machines for one evaluated sample
   * @return Outcome describing any message sent or failed
   */
  NotificationOutcome consider(const Evaluation& ev, const Config& config) {
    NotificationOutcome out;
    const auto now = ev.sample.timestamp;
    std::vector<Metric> due;

    for (Metric m : {Metric::Temperature, Metric::Humidity}) {
      ConditionState& st = state_.of(m);
      if (ev.status_of(m) == Status::Ok) {
        st.phase = AlertPhase::Normal;
        st.last_notified_at.reset();
        continue;
      }
      if (st.phase == AlertPhase::Normal) {
        st.phase = AlertPhase::Alerting;
        st.last_notified_at.reset();
        due.push_back(m);
      } else if (needs_resend(st, now)) {
        due.push_back(m);
      }
    }

    if (due.empty()) return out;

    MailMessage msg = build_breach_message(ev, due, config);
    std::string error;
    if (deliver(msg, error)) {
      for (Metric m : due) state_.of(m).last_notified_at = now;
      out.sent = true;
      out.notified = due;
    } else {
      out.failed_metrics = due;
      out.error = error;
    }
    return out;
  }

  /**
   * @brief Account for a failed sensor read
   *
   * Sends one fault alert per fault episode once @p consecutive_failures
   * reaches config.sensor_fault_alert_after (0 disables fault alerts).
   */
  NotificationOutcome consider_fault(ErrorState error, const std::string& cause,
                                     std::uint32_t consecutive_failures, const Config& config) {
    NotificationOutcome out;
    if (config.sensor_fault_alert_after <= 0 ||
        consecutive_failures < static_cast<std::uint32_t>(config.sensor_fault_alert_after)) {
      return out;
    }

    const auto now = std::chrono::system_clock::now();
    ConditionState& st = state_.sensor_fault;
    if (st.phase == AlertPhase::Normal) {
      st.phase = AlertPhase::Alerting;
      st.last_notified_at.reset();
    } else if (!needs_resend(st, now)) {
      return out;
    }

    MailMessage msg = build_fault_message(error, cause, consecutive_failures, now, config);
    std::string why;
    if (deliver(msg, why)) {
      st.last_notified_at = now;
      out.sent = true;
      out.fault_notified = true;
    } else {
      out.fault_failed = true;
      out.error = why;
    }
    return out;
  }

  /**
   * @brief Re-arm the sensor fault alert after a successful read
   */
  void sensor_recovered() {
    state_.sensor_fault = ConditionState{};
  }

  const AlertState& state() const { return state_; }
  std::uint64_t messages_sent() const { return messages_sent_; }
  std::uint64_t delivery_failures() const { return delivery_failures_; }

  /**
   * @brief Compose the alert for the metrics breached by one sample
   */
  static MailMessage build_breach_message(const Evaluation& ev, const std::vector<Metric>& metrics,
                                          const Config& config) {
    std::string label;
    for (Metric m : metrics) {
      if (!label.empty()) label += "/";
      label += upper(metric_name(m));
    }

    MailMessage msg;
    msg.sender = config.sender;
    msg.receivers = config.receivers;
    msg.subject = "[" + label + " WARNING]: ROOM " + config.room + " - " + timefmt::human(ev.sample.timestamp);

    std::ostringstream body;
    body << std::fixed << std::setprecision(3);
    for (Metric m : metrics) {
      Status s = ev.status_of(m);
      const Range& r = range_for(m, config);
      std::string name = metric_name(m);
      name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
      body << name << " is out of range in room " << config.room << ". "
           << "The current " << metric_name(m) << " reading is " << ev.value_of(m) << " " << metric_units(m)
           << ", " << status_name(s) << " the " << (s == Status::Below ? "minimum" : "maximum")
           << " of " << r.breached_bound(s) << " " << metric_units(m) << ".\n";
    }
    body << "Reading taken at " << timefmt::human(ev.sample.timestamp) << ".\n";
    msg.body = body.str();
    return msg;
  }

  static MailMessage build_fault_message(ErrorState error, const std::string& cause,
                                         std::uint32_t consecutive_failures,
                                         std::chrono::system_clock::time_point now, const Config& config) {
    MailMessage msg;
    msg.sender = config.sender;
    msg.receivers = config.receivers;
    msg.subject = "[SENSOR FAULT]: ROOM " + config.room + " - " + timefmt::human(now);

    std::ostringstream body;
    body << "The sensor in room " << config.room << " has failed " << consecutive_failures
         << " consecutive readings.\n"
         << "Last error: " << error_to_string(error) << ": " << cause << "\n"
         << "Temperature and humidity are not being monitored until the sensor recovers.\n";
    msg.body = body.str();
    return msg;
  }

private:
  bool needs_resend(const ConditionState& st, std::chrono::system_clock::time_point now) const {
    if (!st.last_notified_at) return true;  // earlier delivery failed
    if (policy_.renotify_after.count() <= 0) return false;
    return now - *st.last_notified_at >= policy_.renotify_after;
  }

  bool deliver(const MailMessage& msg, std::string& error) {
    auto mailer = mailer_;
    try {
      call_with_deadline("mail delivery", timeout_, [mailer, msg]() { mailer->send(msg); });
      messages_sent_++;
      return true;
    } catch (const DeliveryError& e) {
      error = e.what();
    } catch (const DeadlineExceeded& e) {
      error = e.what();
    } catch (const std::exception& e) {
      error = std::string("unexpected mailer failure: ") + e.what();
    }
    delivery_failures_++;
    return false;
  }

  static std::string upper(const char* s) {
    std::string r(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return r;
  }
};
