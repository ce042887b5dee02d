#include "metrics.h"
#include <sstream>
#include <algorithm>
#include <numeric>
#include <nlohmann/json.hpp>

namespace cleanpath {

static const size_t kMaxHistogramSamples = 1000;

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

std::atomic<int64_t>& Metrics::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.try_emplace(name, 0).first->second;
}

void Metrics::increment_counter(const std::string& name, int64_t value) {
    counter(name).fetch_add(value, std::memory_order_relaxed);
}

int64_t Metrics::get_counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it != counters_.end()) {
        return it->second.load(std::memory_order_relaxed);
    }
    return 0;
}

void Metrics::set_gauge(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[name] = value;
}

void Metrics::record_histogram(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& values = histograms_[name];
    values.push_back(value);
    if (values.size() > kMaxHistogramSamples) {
        values.erase(values.begin());
    }
}

std::string Metrics::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, value] : counters_) {
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << value.load(std::memory_order_relaxed) << "\n";
    }

    for (const auto& [name, value] : gauges_) {
        oss << "# TYPE " << name << " gauge\n";
        oss << name << " " << value << "\n";
    }

    for (const auto& [name, values] : histograms_) {
        if (values.empty()) continue;

        double sum = std::accumulate(values.begin(), values.end(), 0.0);
        auto [min, max] = std::minmax_element(values.begin(), values.end());

        oss << "# TYPE " << name << "_avg gauge\n";
        oss << name << "_avg " << sum / values.size() << "\n";
        oss << "# TYPE " << name << "_min gauge\n";
        oss << name << "_min " << *min << "\n";
        oss << "# TYPE " << name << "_max gauge\n";
        oss << name << "_max " << *max << "\n";
    }

    return oss.str();
}

std::string Metrics::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json result;
    result["counters"] = nlohmann::json::object();
    result["gauges"] = nlohmann::json::object();
    for (const auto& [name, value] : counters_) {
        result["counters"][name] = value.load(std::memory_order_relaxed);
    }
    for (const auto& [name, value] : gauges_) {
        result["gauges"][name] = value;
    }
    return result.dump(2);
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    // counter() handles must survive a reset
    for (auto& [name, value] : counters_) {
        value.store(0, std::memory_order_relaxed);
    }
    gauges_.clear();
    histograms_.clear();
}

} // namespace cleanpath
