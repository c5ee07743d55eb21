#include "wager/metrics.hpp"
#include <sstream>

namespace wager {

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter* MetricsRegistry::get_counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = counters_.find(name);
    if (it != counters_.end()) {
        return it->second.get();
    }

    auto counter = std::make_unique<Counter>();
    Counter* ptr = counter.get();
    counters_[name] = std::move(counter);

    return ptr;
}

uint64_t MetricsRegistry::counter_value(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it != counters_.end() ? it->second->get() : 0;
}

std::string MetricsRegistry::get_prometheus_output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream ss;

    for (const auto& [name, counter] : counters_) {
        ss << "# TYPE " << name << " counter\n";
        ss << name << " " << counter->get() << "\n";
    }

    return ss.str();
}

} // namespace wager
