#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#if HUMIDOR_WITH_METRICS
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#endif

namespace humidor {

using MetricLabels = std::map<std::string, std::string>;

class MonitoringCounter {
public:
    explicit MonitoringCounter(std::function<void(double)> fn = nullptr);
    void Increment(double value = 1.0) const;

private:
    std::function<void(double)> fn_;
};

class MonitoringGauge {
public:
    explicit MonitoringGauge(std::function<void(double)> fn = nullptr);
    void Set(double value) const;

private:
    std::function<void(double)> fn_;
};

// Process-wide counters and gauges. Current values are always kept in
// process; with HUMIDOR_WITH_METRICS they are mirrored into a prometheus
// registry as well.
class MetricRegistry {
public:
    static MetricRegistry& Instance();

    std::shared_ptr<MonitoringCounter> BuildCounter(const std::string& name,
                                                    const std::string& help,
                                                    const MetricLabels& labels = {});
    std::shared_ptr<MonitoringGauge> BuildGauge(const std::string& name,
                                                const std::string& help,
                                                const MetricLabels& labels = {});

    // Current value of a counter or gauge, 0 when never built.
    double Value(const std::string& name, const MetricLabels& labels = {}) const;

#if HUMIDOR_WITH_METRICS
    std::shared_ptr<prometheus::Registry> GetPrometheusRegistry() const;
#endif

private:
    MetricRegistry();

    static std::string BuildMetricKey(const std::string& name, const MetricLabels& labels);
    void Add(const std::string& key, double delta);
    void Store(const std::string& key, double value);

    mutable std::mutex mutex_;
    std::map<std::string, double> values_;

#if HUMIDOR_WITH_METRICS
    std::shared_ptr<prometheus::Registry> registry_;
    std::map<std::string, prometheus::Family<prometheus::Counter>*> counter_families_;
    std::map<std::string, prometheus::Family<prometheus::Gauge>*> gauge_families_;
#endif
};

}  // namespace humidor
