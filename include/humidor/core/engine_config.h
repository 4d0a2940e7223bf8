#pragma once

#include <string>

namespace humidor {

struct EngineConfig {
    std::string data_dir{"./humidor_data"};
    double default_tax_rate{0.086};
    std::string log_level{"info"};
    std::string log_sink{"stderr"};
    std::string inventory_file{"cigar_inventory.json"};
    std::string ledger_file{"transaction_ledger.json"};
    std::string catalog_file{"cigar_catalog.json"};
    std::string legacy_sales_file{"sales_history.json"};
    bool autosave{true};
};

class EngineConfigLoader {
public:
    // Reads a flat `humidor:` yaml file. `${VAR}` references in values are
    // expanded from the environment and HUMIDOR_DATA_DIR overrides data_dir.
    static bool LoadFromYaml(const std::string& path, EngineConfig* config, std::string* error);

    // Loads HUMIDOR_CONFIG_PATH when set, defaults otherwise.
    static bool LoadFromEnvironment(EngineConfig* config, std::string* error);

    static std::string ResolveEnvVars(const std::string& value);
};

}  // namespace humidor
