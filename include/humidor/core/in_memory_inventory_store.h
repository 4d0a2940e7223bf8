#pragma once

#include <mutex>
#include <string>

#include "humidor/interfaces/inventory_store.h"

namespace humidor {

class InMemoryInventoryStore : public IInventoryStore {
public:
    InMemoryInventoryStore() = default;
    explicit InMemoryInventoryStore(InventorySnapshot initial);

    bool Load(InventorySnapshot* snapshot, std::string* error) override;
    bool Save(const InventorySnapshot& snapshot, std::string* error) override;

    // Subsequent saves fail with `error` until cleared with an empty string.
    void FailSavesWith(const std::string& error);

    InventorySnapshot saved() const;
    std::size_t save_count() const;

private:
    mutable std::mutex mutex_;
    InventorySnapshot snapshot_;
    std::string save_error_;
    std::size_t save_count_{0};
};

}  // namespace humidor
