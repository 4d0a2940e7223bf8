#include "humidor/core/in_memory_inventory_store.h"

#include <utility>

namespace humidor {

InMemoryInventoryStore::InMemoryInventoryStore(InventorySnapshot initial)
    : snapshot_(std::move(initial)) {}

bool InMemoryInventoryStore::Load(InventorySnapshot* snapshot, std::string* error) {
    if (snapshot == nullptr) {
        if (error != nullptr) {
            *error = "snapshot output is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    *snapshot = snapshot_;
    return true;
}

bool InMemoryInventoryStore::Save(const InventorySnapshot& snapshot, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!save_error_.empty()) {
        if (error != nullptr) {
            *error = save_error_;
        }
        return false;
    }
    snapshot_ = snapshot;
    ++save_count_;
    return true;
}

void InMemoryInventoryStore::FailSavesWith(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    save_error_ = error;
}

InventorySnapshot InMemoryInventoryStore::saved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::size_t InMemoryInventoryStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

}  // namespace humidor
