#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#if HUMIDOR_WITH_METRICS
#include <prometheus/exposer.h>
#endif

namespace humidor {

// Serves MetricRegistry over HTTP at /metrics on a background thread.
class MetricsExporter {
public:
    MetricsExporter() = default;
    ~MetricsExporter();

    bool Start(int port, std::string* error);
    void Stop();
    bool IsRunning() const;

private:
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread worker_;
    mutable std::mutex error_mutex_;
    std::string start_error_;

#if HUMIDOR_WITH_METRICS
    std::unique_ptr<prometheus::Exposer> exposer_;
#endif
};

}  // namespace humidor
