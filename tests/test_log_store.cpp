#include "../src/monitor/log_store.hpp"
#include "../src/monitor/evaluator.hpp"
#include <cassert>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>

/**
 * @brief Test the append-only, day-partitioned log store
 */
namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(const fs::path& p) {
    std::vector<std::string> lines;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

// Local noon on a given calendar day
std::chrono::system_clock::time_point local_noon(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

Config test_config() {
    Config c;
    c.room = "B-204";
    c.temp_range = {20.0, 30.0};
    c.humidity_range = {30.0, 50.0};
    return c;
}

} // namespace

int main() {
    std::cout << "Testing LogStore..." << std::endl;

    fs::path root = fs::temp_directory_path() / ("room_monitor_logs_" + std::to_string(::getpid()));
    fs::remove_all(root);
    Config cfg = test_config();

    // Test 1: directory layout
    {
        std::cout << "Test 1: Layout" << std::endl;

        LogStore store(root);
        fs::path p = store.path_for(local_noon(2024, 3, 7));
        assert(p == root / "2024" / "03-2024" / "03-07-2024.log");

        std::cout << "  Layout test passed" << std::endl;
    }

    // Test 2: sample records
    {
        std::cout << "Test 2: Sample records" << std::endl;

        LogStore store(root);
        auto ts = local_noon(2024, 3, 7);

        LogRecord rec;
        rec.timestamp = ts;
        rec.tick = 1;
        rec.room = cfg.room;
        rec.evaluation = evaluate(Sample(ts, 25.0, 40.0), cfg);
        assert(store.record(rec));

        LogRecord alert;
        alert.timestamp = ts + std::chrono::minutes(5);
        alert.tick = 2;
        alert.room = cfg.room;
        alert.evaluation = evaluate(Sample(alert.timestamp, 32.5, 40.0), cfg);
        alert.notification.sent = true;
        alert.notification.notified = {Metric::Temperature};
        alert.overrun = true;
        alert.skipped_slots = 2;
        assert(store.record(alert));
        assert(store.records_written() == 2);

        auto lines = read_lines(store.path_for(ts));
        assert(lines.size() == 2);

        auto j = nlohmann::json::parse(lines[0]);
        assert(j["event"] == "sample");
        assert(j["tick"] == 1);
        assert(j["room"] == "B-204");
        assert(j["temperature_c"] == 25.0);
        assert(j["humidity_pct"] == 40.0);
        assert(j["temp_status"] == "ok");
        assert(j["humidity_status"] == "ok");
        assert(j["notification_sent"] == false);
        assert(j["notified"].empty());
        assert(j["failed_metrics"].empty());
        assert(!j.contains("sensor_error"));
        assert(j["overrun"] == false);
        assert(j["skipped_slots"] == 0);
        assert(j["ts"].get<std::string>().rfind("2024-03-07T12:00:00.000", 0) == 0);

        auto k = nlohmann::json::parse(lines[1]);
        assert(k["temp_status"] == "above");
        assert(k["notification_sent"] == true);
        assert(k["notified"].size() == 1 && k["notified"][0] == "temperature");
        assert(k["overrun"] == true);
        assert(k["skipped_slots"] == 2);

        std::cout << "  Sample records test passed" << std::endl;
    }

    // Test 3: sensor errors and delivery failures are recorded
    {
        std::cout << "Test 3: Error records" << std::endl;

        LogStore store(root);
        auto ts = local_noon(2024, 3, 7) + std::chrono::minutes(10);

        LogRecord rec;
        rec.timestamp = ts;
        rec.event = LogEvent::SensorError;
        rec.tick = 3;
        rec.room = cfg.room;
        rec.sensor_error = ErrorState::CHECKSUM_ERROR;
        rec.sensor_cause = "SHT4x CRC mismatch (temperature)";
        rec.notification.fault_failed = true;
        rec.notification.error = "relay refused connection";
        assert(store.record(rec));

        auto lines = read_lines(store.path_for(ts));
        assert(lines.size() == 3); // appended to the day file from test 2

        auto j = nlohmann::json::parse(lines[2]);
        assert(j["event"] == "sensor_error");
        assert(j["sensor_error"]["state"] == "CHECKSUM_ERROR");
        assert(j["sensor_error"]["cause"] == "SHT4x CRC mismatch (temperature)");
        assert(!j.contains("temperature_c"));
        assert(j["failed_metrics"].size() == 1 && j["failed_metrics"][0] == "sensor");
        assert(j["delivery_error"] == "relay refused connection");

        std::cout << "  Error records test passed" << std::endl;
    }

    // Test 4: day rollover
    {
        std::cout << "Test 4: Day rollover" << std::endl;

        LogStore store(root);
        LogRecord a;
        a.timestamp = local_noon(2024, 12, 31);
        a.event = LogEvent::Start;
        a.room = cfg.room;
        a.message = "monitoring started";
        assert(store.record(a));

        LogRecord b = a;
        b.timestamp = local_noon(2025, 1, 1);
        b.event = LogEvent::Stop;
        b.message = "monitoring stopped";
        assert(store.record(b));

        auto first = read_lines(root / "2024" / "12-2024" / "12-31-2024.log");
        auto second = read_lines(root / "2025" / "01-2025" / "01-01-2025.log");
        assert(first.size() == 1 && second.size() == 1);
        assert(nlohmann::json::parse(first[0])["event"] == "start");
        auto stop = nlohmann::json::parse(second[0]);
        assert(stop["event"] == "stop");
        assert(stop["message"] == "monitoring stopped");
        assert(!stop.contains("notification_sent"));
        assert(!stop.contains("overrun"));
        assert(store.current_path() == root / "2025" / "01-2025" / "01-01-2025.log");

        std::cout << "  Day rollover test passed" << std::endl;
    }

    // Test 5: truncated tail from an interrupted write is terminated
    {
        std::cout << "Test 5: Truncated tail" << std::endl;

        auto ts = local_noon(2024, 6, 1);
        LogStore probe(root);
        fs::path p = probe.path_for(ts);
        fs::create_directories(p.parent_path());
        {
            std::ofstream out(p);
            out << "{\"event\":\"sample\",\"tick\":1}\n{\"event\":\"sam";
        }

        LogStore store(root);
        LogRecord rec;
        rec.timestamp = ts;
        rec.tick = 2;
        rec.room = cfg.room;
        rec.evaluation = evaluate(Sample(ts, 22.0, 41.0), cfg);
        assert(store.record(rec));

        auto lines = read_lines(p);
        assert(lines.size() == 3);
        assert(nlohmann::json::parse(lines[0])["tick"] == 1);   // prior record intact
        assert(lines[1] == "{\"event\":\"sam");
        assert(nlohmann::json::parse(lines[2])["tick"] == 2);   // new record on its own line

        std::cout << "  Truncated tail test passed" << std::endl;
    }

    // Test 6: unwritable root is reported, not thrown
    {
        std::cout << "Test 6: Write failure" << std::endl;

        fs::path blocker = root / "not-a-directory";
        {
            std::ofstream out(blocker);
            out << "x";
        }
        LogStore store(blocker);
        LogRecord rec;
        rec.timestamp = std::chrono::system_clock::now();
        rec.room = cfg.room;
        assert(!store.record(rec));
        assert(!store.last_error().empty());
        assert(store.failures() == 1);
        assert(store.records_written() == 0);

        std::cout << "  Write failure test passed (" << store.last_error() << ")" << std::endl;
    }

    fs::remove_all(root);
    std::cout << "\n✅ All LogStore tests passed!" << std::endl;
    return 0;
}
