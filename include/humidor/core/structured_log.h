#pragma once

#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/core/engine_config.h"

namespace humidor {

using LogFields = std::vector<std::pair<std::string, std::string>>;

inline std::string NormalizeLogLevel(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value == "warning" ? "warn" : value;
}

inline int LogLevelRank(const std::string& level) {
    const auto normalized = NormalizeLogLevel(level);
    if (normalized == "debug") {
        return 10;
    }
    if (normalized == "warn") {
        return 30;
    }
    if (normalized == "error") {
        return 40;
    }
    return 20;
}

inline std::string EscapeLogValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char ch : value) {
        if (ch == '\n') {
            escaped += "\\n";
            continue;
        }
        if (ch == '"' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

// One line per event: ts_ns=... level=... app=... event=... key="value".
inline void EmitStructuredLog(const EngineConfig* config,
                              const std::string& app,
                              const std::string& level,
                              const std::string& event,
                              const LogFields& fields = {}) {
    const std::string normalized_level = NormalizeLogLevel(level);
    const std::string configured_level =
        config == nullptr ? "info" : NormalizeLogLevel(config->log_level);
    if (LogLevelRank(normalized_level) < LogLevelRank(configured_level)) {
        return;
    }

    std::ostream* out = &std::cerr;
    if (config != nullptr && NormalizeLogLevel(config->log_sink) == "stdout") {
        out = &std::cout;
    }

    (*out) << "ts_ns=" << NowEpochNanos() << " level=" << normalized_level << " app=" << app
           << " event=" << event;
    for (const auto& [key, value] : fields) {
        (*out) << " " << key << "=\"" << EscapeLogValue(value) << "\"";
    }
    (*out) << '\n';
}

}  // namespace humidor
