#include "../src/monitor/notifier.hpp"
#include "../src/monitor/evaluator.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <string>
#include <vector>

/**
 * @brief Test alert suppression state machine and message batching
 */
namespace {

// Records every message; can be told to fail deliveries
struct RecordingMailer : IMailer {
    std::mutex mu;
    std::vector<MailMessage> sent;
    int attempts{0};
    bool fail{false};

    void send(const MailMessage& msg) override {
        std::lock_guard<std::mutex> lock(mu);
        attempts++;
        if (fail) throw DeliveryError("relay refused connection");
        sent.push_back(msg);
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mu);
        return sent.size();
    }
};

Config scenario_config() {
    Config c;
    c.room = "B-204";
    c.sender = "pi@lab.example.org";
    c.receivers = {"alice@example.org", "ops@lab.example.org"};
    c.temp_range = {20.0, 30.0};
    c.humidity_range = {30.0, 50.0};
    c.interval_seconds = 300;
    c.log_root = "/tmp";
    return c;
}

struct Harness {
    Config config = scenario_config();
    std::shared_ptr<RecordingMailer> mailer = std::make_shared<RecordingMailer>();
    Notifier notifier;
    std::chrono::system_clock::time_point t = std::chrono::system_clock::now();

    explicit Harness(AlertPolicy policy = AlertPolicy{})
        : notifier(mailer, std::chrono::milliseconds(1000), policy) {}

    NotificationOutcome feed(double temp, double hum) {
        t += std::chrono::seconds(config.interval_seconds);
        return notifier.consider(evaluate(Sample(t, temp, hum), config), config);
    }
};

bool contains(const std::string& s, const std::string& what) {
    return s.find(what) != std::string::npos;
}

} // namespace

int main() {
    std::cout << "Testing Notifier..." << std::endl;

    // Test 1: reference scenario
    {
        std::cout << "Test 1: Reference scenario" << std::endl;

        Harness h;
        NotificationOutcome o = h.feed(25, 40);    // ok/ok
        assert(!o.sent && h.mailer->count() == 0);

        o = h.feed(32, 40);                        // above/ok -> alert
        assert(o.sent);
        assert(o.notified.size() == 1 && o.notified[0] == Metric::Temperature);
        assert(h.mailer->count() == 1);

        o = h.feed(33, 40);                        // still above -> suppressed
        assert(!o.sent && o.failed_metrics.empty());
        assert(h.mailer->count() == 1);

        o = h.feed(25, 40);                        // silent recovery
        assert(!o.sent);
        assert(h.mailer->count() == 1);
        assert(h.notifier.state().of(Metric::Temperature).phase == AlertPhase::Normal);

        o = h.feed(32, 55);                        // both above -> one message
        assert(o.sent);
        assert(o.notified.size() == 2);
        assert(h.mailer->count() == 2);

        const MailMessage& last = h.mailer->sent.back();
        assert(contains(last.subject, "[TEMPERATURE/HUMIDITY WARNING]: ROOM B-204 - "));
        assert(contains(last.body, "Temperature is out of range in room B-204"));
        assert(contains(last.body, "Humidity is out of range in room B-204"));
        assert(contains(last.body, "32.000 C, above the maximum of 30.000 C"));
        assert(contains(last.body, "55.000 %, above the maximum of 50.000 %"));

        std::cout << "  Reference scenario test passed" << std::endl;
    }

    // Test 2: N consecutive breaches send exactly one alert
    {
        std::cout << "Test 2: Suppression" << std::endl;

        Harness h;
        for (int i = 0; i < 50; i++) {
            h.feed(10.0 - i * 0.1, 40);
        }
        assert(h.mailer->count() == 1);
        assert(h.notifier.messages_sent() == 1);
        assert(h.notifier.state().of(Metric::Temperature).phase == AlertPhase::Alerting);
        assert(h.notifier.state().of(Metric::Temperature).last_notified_at.has_value());

        const MailMessage& msg = h.mailer->sent.front();
        assert(msg.subject.find("[TEMPERATURE WARNING]: ROOM B-204 - ") == 0);
        assert(contains(msg.body, "10.000 C, below the minimum of 20.000 C"));
        assert(msg.sender == "pi@lab.example.org");
        assert(msg.receivers.size() == 2 && msg.receivers[1] == "ops@lab.example.org");

        std::cout << "  Suppression test passed" << std::endl;
    }

    // Test 3: recovery re-arms the alert
    {
        std::cout << "Test 3: Recovery re-arms" << std::endl;

        Harness h;
        h.feed(25, 60);
        h.feed(25, 61);
        h.feed(25, 45);  // ok
        h.feed(25, 62);
        h.feed(25, 63);
        assert(h.mailer->count() == 2);
        assert(h.mailer->sent[0].subject.find("[HUMIDITY WARNING]") == 0);
        assert(h.mailer->sent[1].subject.find("[HUMIDITY WARNING]") == 0);

        std::cout << "  Recovery re-arms test passed" << std::endl;
    }

    // Test 4: metrics are tracked independently
    {
        std::cout << "Test 4: Independent metrics" << std::endl;

        Harness h;
        h.feed(35, 40);          // temperature episode starts
        NotificationOutcome o = h.feed(35, 20); // humidity joins; temperature suppressed
        assert(o.sent);
        assert(o.notified.size() == 1 && o.notified[0] == Metric::Humidity);
        assert(h.mailer->count() == 2);
        assert(h.mailer->sent[1].subject.find("[HUMIDITY WARNING]") == 0);
        assert(contains(h.mailer->sent[1].body, "below the minimum of 30.000 %"));
        assert(!contains(h.mailer->sent[1].body, "Temperature"));

        std::cout << "  Independent metrics test passed" << std::endl;
    }

    // Test 5: failed delivery stays alerting and is retried
    {
        std::cout << "Test 5: Delivery failure" << std::endl;

        Harness h;
        h.mailer->fail = true;
        NotificationOutcome o = h.feed(32, 40);
        assert(!o.sent);
        assert(o.delivery_failed());
        assert(o.failed_metrics.size() == 1 && o.failed_metrics[0] == Metric::Temperature);
        assert(contains(o.error, "relay refused connection"));
        assert(h.notifier.state().of(Metric::Temperature).phase == AlertPhase::Alerting);
        assert(!h.notifier.state().of(Metric::Temperature).last_notified_at.has_value());
        assert(h.notifier.delivery_failures() == 1);

        h.mailer->fail = false;
        o = h.feed(33, 40);      // retried on the next qualifying tick
        assert(o.sent);
        assert(h.mailer->count() == 1);
        assert(h.mailer->attempts == 2);

        o = h.feed(34, 40);      // and then suppressed as usual
        assert(!o.sent);
        assert(h.mailer->attempts == 2);

        // a failed episode that recovers before the retry sends nothing
        Harness g;
        g.mailer->fail = true;
        g.feed(15, 40);
        g.mailer->fail = false;
        g.feed(25, 40);
        assert(g.mailer->count() == 0);

        std::cout << "  Delivery failure test passed" << std::endl;
    }

    // Test 6: hung mailer is bounded by the deadline
    {
        std::cout << "Test 6: Mailer deadline" << std::endl;

        struct HangingMailer : IMailer {
            void send(const MailMessage&) override {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
        };
        Config cfg = scenario_config();
        Notifier n(std::make_shared<HangingMailer>(), std::chrono::milliseconds(50));
        auto start = std::chrono::steady_clock::now();
        NotificationOutcome o = n.consider(evaluate(Sample(std::chrono::system_clock::now(), 40, 40), cfg), cfg);
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(!o.sent);
        assert(o.delivery_failed());
        assert(contains(o.error, "deadline"));
        assert(elapsed < std::chrono::milliseconds(400));

        std::cout << "  Mailer deadline test passed" << std::endl;
    }

    // Test 7: optional re-notify cooldown
    {
        std::cout << "Test 7: Re-notify cooldown" << std::endl;

        AlertPolicy policy;
        policy.renotify_after = std::chrono::hours(1);
        Harness h(policy);     // ticks are 5 minutes apart
        for (int i = 0; i < 25; i++) {
            h.feed(40, 40);    // 2 hours of one episode
        }
        // t=0, t=60min, t=120min
        assert(h.mailer->count() == 3);

        Harness once;          // default policy: one mail per episode
        for (int i = 0; i < 25; i++) {
            once.feed(40, 40);
        }
        assert(once.mailer->count() == 1);

        std::cout << "  Re-notify cooldown test passed" << std::endl;
    }

    // Test 8: sensor fault alerts
    {
        std::cout << "Test 8: Sensor fault alert" << std::endl;

        Harness h;
        NotificationOutcome o = h.notifier.consider_fault(ErrorState::TIMEOUT, "no answer", 5, h.config);
        assert(!o.sent);           // disabled by default
        assert(h.mailer->count() == 0);

        h.config.sensor_fault_alert_after = 3;
        o = h.notifier.consider_fault(ErrorState::COMMUNICATION_ERROR, "nack", 1, h.config);
        assert(!o.sent);
        o = h.notifier.consider_fault(ErrorState::COMMUNICATION_ERROR, "nack", 2, h.config);
        assert(!o.sent);
        o = h.notifier.consider_fault(ErrorState::COMMUNICATION_ERROR, "nack", 3, h.config);
        assert(o.sent && o.fault_notified);
        o = h.notifier.consider_fault(ErrorState::COMMUNICATION_ERROR, "nack", 4, h.config);
        assert(!o.sent);
        assert(h.mailer->count() == 1);

        const MailMessage& msg = h.mailer->sent.back();
        assert(msg.subject.find("[SENSOR FAULT]: ROOM B-204 - ") == 0);
        assert(contains(msg.body, "failed 3 consecutive readings"));
        assert(contains(msg.body, "COMMUNICATION_ERROR: nack"));
        assert(h.notifier.state().sensor_fault.phase == AlertPhase::Alerting);

        h.notifier.sensor_recovered();
        assert(h.notifier.state().sensor_fault.phase == AlertPhase::Normal);
        h.mailer->fail = true;
        o = h.notifier.consider_fault(ErrorState::TIMEOUT, "stuck", 3, h.config);
        assert(o.fault_failed && !o.sent);
        h.mailer->fail = false;
        o = h.notifier.consider_fault(ErrorState::TIMEOUT, "stuck", 4, h.config);
        assert(o.fault_notified);
        assert(h.mailer->count() == 2);

        std::cout << "  Sensor fault alert test passed" << std::endl;
    }

    std::cout << "\n✅ All Notifier tests passed!" << std::endl;
    return 0;
}
