#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include "humidor/contracts/types.h"

namespace humidor {

// Ledger dates are persisted as "YYYY-MM-DD HH:MM:SS" in UTC.
class Timestamp {
public:
    Timestamp() = default;
    explicit Timestamp(EpochNanos ns) : ns_(ns) {}

    static bool TryFromText(const std::string& text, Timestamp* out) {
        if (out == nullptr || text.empty()) {
            return false;
        }
        std::tm tm = {};
        tm.tm_isdst = 0;

        std::istringstream iss_datetime(text);
        iss_datetime >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (iss_datetime.fail()) {
            tm = {};
            std::istringstream iss_date(text);
            iss_date >> std::get_time(&tm, "%Y-%m-%d");
            if (iss_date.fail()) {
                return false;
            }
        }

        const std::time_t seconds = timegm(&tm);
        if (seconds < 0) {
            return false;
        }
        *out = Timestamp(static_cast<EpochNanos>(seconds) * 1'000'000'000);
        return true;
    }

    static Timestamp FromText(const std::string& text) {
        Timestamp parsed;
        if (!TryFromText(text, &parsed)) {
            throw std::runtime_error("invalid timestamp format: " + text);
        }
        return parsed;
    }

    static Timestamp Now() { return Timestamp(NowEpochNanos()); }

    std::string ToText() const { return Format("%Y-%m-%d %H:%M:%S"); }

    // Compact form used inside generated transaction ids.
    std::string ToCompact() const { return Format("%Y%m%d%H%M%S"); }

    EpochNanos ToEpochNanos() const { return ns_; }

    bool operator<(const Timestamp& other) const { return ns_ < other.ns_; }
    bool operator==(const Timestamp& other) const { return ns_ == other.ns_; }
    bool operator!=(const Timestamp& other) const { return ns_ != other.ns_; }

private:
    std::string Format(const char* pattern) const {
        const auto seconds = static_cast<std::time_t>(ns_ / 1'000'000'000);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, pattern);
        return oss.str();
    }

    EpochNanos ns_{0};
};

}  // namespace humidor
