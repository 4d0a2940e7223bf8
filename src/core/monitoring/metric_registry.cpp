#include "humidor/monitoring/metric_registry.h"

#include <utility>

namespace humidor {

MonitoringCounter::MonitoringCounter(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void MonitoringCounter::Increment(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MonitoringGauge::MonitoringGauge(std::function<void(double)> fn) : fn_(std::move(fn)) {}

void MonitoringGauge::Set(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MetricRegistry& MetricRegistry::Instance() {
    static MetricRegistry instance;
    return instance;
}

MetricRegistry::MetricRegistry() {
#if HUMIDOR_WITH_METRICS
    registry_ = std::make_shared<prometheus::Registry>();
#endif
}

std::string MetricRegistry::BuildMetricKey(const std::string& name, const MetricLabels& labels) {
    std::string key = name;
    for (const auto& [label_key, label_value] : labels) {
        key += "|" + label_key + "=" + label_value;
    }
    return key;
}

void MetricRegistry::Add(const std::string& key, double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] += delta;
}

void MetricRegistry::Store(const std::string& key, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::shared_ptr<MonitoringCounter> MetricRegistry::BuildCounter(const std::string& name,
                                                                const std::string& help,
                                                                const MetricLabels& labels) {
    const std::string key = BuildMetricKey(name, labels);
#if !HUMIDOR_WITH_METRICS
    (void)help;
    return std::make_shared<MonitoringCounter>([this, key](double value) { Add(key, value); });
#else
    prometheus::Counter* metric = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto family_it = counter_families_.find(name);
        if (family_it == counter_families_.end()) {
            auto* family = &prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
            family_it = counter_families_.emplace(name, family).first;
        }
        metric = &family_it->second->Add(labels);
    }
    return std::make_shared<MonitoringCounter>([this, key, metric](double value) {
        Add(key, value);
        metric->Increment(value);
    });
#endif
}

std::shared_ptr<MonitoringGauge> MetricRegistry::BuildGauge(const std::string& name,
                                                            const std::string& help,
                                                            const MetricLabels& labels) {
    const std::string key = BuildMetricKey(name, labels);
#if !HUMIDOR_WITH_METRICS
    (void)help;
    return std::make_shared<MonitoringGauge>([this, key](double value) { Store(key, value); });
#else
    prometheus::Gauge* metric = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto family_it = gauge_families_.find(name);
        if (family_it == gauge_families_.end()) {
            auto* family = &prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);
            family_it = gauge_families_.emplace(name, family).first;
        }
        metric = &family_it->second->Add(labels);
    }
    return std::make_shared<MonitoringGauge>([this, key, metric](double value) {
        Store(key, value);
        metric->Set(value);
    });
#endif
}

double MetricRegistry::Value(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = values_.find(BuildMetricKey(name, labels));
    return it == values_.end() ? 0.0 : it->second;
}

#if HUMIDOR_WITH_METRICS
std::shared_ptr<prometheus::Registry> MetricRegistry::GetPrometheusRegistry() const {
    return registry_;
}
#endif

}  // namespace humidor
