#pragma once

#include <string>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/services/catalog_book.h"

namespace humidor {

struct InventorySnapshot {
    std::vector<Lot> lots;
    std::vector<LedgerEntry> entries;
    std::vector<TransactionRecord> transactions;
    CatalogSnapshot catalog;
};

class IInventoryStore {
public:
    virtual ~IInventoryStore() = default;
    // A store with nothing saved yet loads an empty snapshot successfully.
    virtual bool Load(InventorySnapshot* snapshot, std::string* error) = 0;
    virtual bool Save(const InventorySnapshot& snapshot, std::string* error) = 0;
};

}  // namespace humidor
