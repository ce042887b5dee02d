#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace cleanpath {

class Metrics {
public:
    static Metrics& instance();

    // Counter metrics. The reference stays valid for the process lifetime,
    // so hot paths can look it up once and increment without locking.
    std::atomic<int64_t>& counter(const std::string& name);
    void increment_counter(const std::string& name, int64_t value = 1);
    int64_t get_counter(const std::string& name) const;

    // Gauge metrics
    void set_gauge(const std::string& name, double value);

    // Histogram metrics (last 1000 samples, reported as min/max/avg)
    void record_histogram(const std::string& name, double value);

    // Prometheus text exposition
    std::string to_prometheus() const;

    std::string to_json() const;

    // Zero counters, drop gauges and histograms
    void reset();

private:
    Metrics() = default;

    std::unordered_map<std::string, std::atomic<int64_t>> counters_;
    std::unordered_map<std::string, double> gauges_;
    std::unordered_map<std::string, std::vector<double>> histograms_;
    mutable std::mutex mutex_;
};

} // namespace cleanpath
