#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace fairdraw {

// Singleton Metrics Registry for operational visibility.
// Thread-safe counters, gauges and duration summaries exported in Prometheus
// text format. Metric names are prefixed with "fairdraw_" on export.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    // Records one observation of an operation's duration in seconds.
    void observe_duration(const std::string& name, double seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& s = summaries_[name];
        s.count += 1;
        s.sum += seconds;
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE fairdraw_" << name << " counter\n";
            ss << "fairdraw_" << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE fairdraw_" << name << " gauge\n";
            ss << "fairdraw_" << name << " " << val << "\n";
        }

        for (const auto& [name, s] : summaries_) {
            ss << "# TYPE fairdraw_" << name << "_seconds summary\n";
            ss << "fairdraw_" << name << "_seconds_count " << s.count << "\n";
            ss << "fairdraw_" << name << "_seconds_sum " << s.sum << "\n";
        }

        return ss.str();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
        summaries_.clear();
    }

private:
    MetricsRegistry() = default;

    struct Summary {
        unsigned long long count = 0;
        double sum = 0.0;
    };

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, Summary> summaries_;
    std::mutex mutex_;
};

}
