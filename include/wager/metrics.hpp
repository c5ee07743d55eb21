#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <map>

namespace wager {

class Counter {
public:
    void increment(uint64_t value = 1) { value_.fetch_add(value, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    Counter* get_counter(const std::string& name);
    uint64_t counter_value(const std::string& name) const;

    std::string get_prometheus_output() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
};

// Convenience macros
#define METRICS_COUNTER(name) wager::MetricsRegistry::instance().get_counter(name)

} // namespace wager
