#include "humidor/core/engine_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "humidor/services/cost_model.h"

namespace humidor {
namespace {

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool LoadSimpleYaml(const std::string& path,
                    std::unordered_map<std::string, std::string>* kv,
                    std::string* error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || line == "humidor:") {
            continue;
        }
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        const auto key = Trim(line.substr(0, pos));
        if (!key.empty()) {
            (*kv)[key] = Trim(line.substr(pos + 1));
        }
    }
    return true;
}

bool ParseBoolValue(const std::string& value, bool* out) {
    const auto normalized = Lowercase(Trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes") {
        *out = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no") {
        *out = false;
        return true;
    }
    return false;
}

bool ParseDoubleValue(const std::string& value, double* out) {
    const auto trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(trimmed.c_str(), &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    *out = parsed;
    return true;
}

bool IsKnownLevel(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "warning" ||
           level == "error";
}

void AssignString(const std::unordered_map<std::string, std::string>& kv,
                  const char* key,
                  std::string* target) {
    const auto it = kv.find(key);
    if (it != kv.end() && !it->second.empty()) {
        *target = it->second;
    }
}

}  // namespace

std::string EngineConfigLoader::ResolveEnvVars(const std::string& value) {
    std::string resolved;
    std::size_t pos = 0;
    while (pos < value.size()) {
        const auto open = value.find("${", pos);
        if (open == std::string::npos) {
            resolved += value.substr(pos);
            break;
        }
        const auto close = value.find('}', open + 2);
        if (close == std::string::npos) {
            resolved += value.substr(pos);
            break;
        }
        resolved += value.substr(pos, open - pos);
        const auto name = value.substr(open + 2, close - open - 2);
        const char* env_value = std::getenv(name.c_str());
        if (env_value != nullptr) {
            resolved += env_value;
        }
        pos = close + 1;
    }
    return resolved;
}

bool EngineConfigLoader::LoadFromYaml(const std::string& path,
                                      EngineConfig* config,
                                      std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::unordered_map<std::string, std::string> kv;
    if (!LoadSimpleYaml(path, &kv, error)) {
        return false;
    }
    for (auto& [key, value] : kv) {
        value = ResolveEnvVars(value);
    }

    EngineConfig loaded;
    AssignString(kv, "data_dir", &loaded.data_dir);
    AssignString(kv, "inventory_file", &loaded.inventory_file);
    AssignString(kv, "ledger_file", &loaded.ledger_file);
    AssignString(kv, "catalog_file", &loaded.catalog_file);
    AssignString(kv, "legacy_sales_file", &loaded.legacy_sales_file);

    if (const auto it = kv.find("default_tax_rate"); it != kv.end()) {
        double raw = 0.0;
        if (!ParseDoubleValue(it->second, &raw) ||
            !CostModel::NormalizeTaxRate(raw, &loaded.default_tax_rate)) {
            if (error != nullptr) {
                *error = "invalid default_tax_rate: " + it->second;
            }
            return false;
        }
    }

    if (const auto it = kv.find("log_level"); it != kv.end()) {
        const auto level = Lowercase(it->second);
        if (!IsKnownLevel(level)) {
            if (error != nullptr) {
                *error = "invalid log_level: " + it->second;
            }
            return false;
        }
        loaded.log_level = level;
    }

    if (const auto it = kv.find("log_sink"); it != kv.end()) {
        const auto sink = Lowercase(it->second);
        if (sink != "stderr" && sink != "stdout") {
            if (error != nullptr) {
                *error = "invalid log_sink: " + it->second;
            }
            return false;
        }
        loaded.log_sink = sink;
    }

    if (const auto it = kv.find("autosave"); it != kv.end()) {
        if (!ParseBoolValue(it->second, &loaded.autosave)) {
            if (error != nullptr) {
                *error = "invalid bool value for autosave";
            }
            return false;
        }
    }

    if (const char* data_dir = std::getenv("HUMIDOR_DATA_DIR");
        data_dir != nullptr && *data_dir != '\0') {
        loaded.data_dir = data_dir;
    }

    *config = std::move(loaded);
    return true;
}

bool EngineConfigLoader::LoadFromEnvironment(EngineConfig* config, std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }
    const char* path = std::getenv("HUMIDOR_CONFIG_PATH");
    if (path != nullptr && *path != '\0') {
        return LoadFromYaml(path, config, error);
    }
    EngineConfig defaults;
    if (const char* data_dir = std::getenv("HUMIDOR_DATA_DIR");
        data_dir != nullptr && *data_dir != '\0') {
        defaults.data_dir = data_dir;
    }
    *config = std::move(defaults);
    return true;
}

}  // namespace humidor
