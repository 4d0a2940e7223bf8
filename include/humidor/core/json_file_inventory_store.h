#pragma once

#include <string>

#include "humidor/core/engine_config.h"
#include "humidor/interfaces/inventory_store.h"

namespace humidor {

// Three JSON documents under data_dir: inventory (array of lots), ledger
// (entries plus transaction records) and catalog. A missing ledger falls back
// to the legacy sales history array.
class JsonFileInventoryStore : public IInventoryStore {
public:
    explicit JsonFileInventoryStore(EngineConfig config);

    bool Load(InventorySnapshot* snapshot, std::string* error) override;
    bool Save(const InventorySnapshot& snapshot, std::string* error) override;

    std::string inventory_path() const;
    std::string ledger_path() const;
    std::string catalog_path() const;
    std::string legacy_sales_path() const;

private:
    std::string PathFor(const std::string& file_name) const;

    EngineConfig config_;
};

}  // namespace humidor
