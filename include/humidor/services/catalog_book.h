#pragma once

#include <set>
#include <string>
#include <vector>

#include "humidor/contracts/types.h"

namespace humidor {

enum class CatalogKind {
    kBrand,
    kSize,
    kType,
};

const char* ToString(CatalogKind kind);

struct CatalogSnapshot {
    std::vector<std::string> brands;
    std::vector<std::string> sizes;
    std::vector<std::string> types;
};

// Known brand, size and type names offered for data entry.
class CatalogBook {
public:
    // Returns true when the value was not already known. Blank values are
    // never stored.
    bool Add(CatalogKind kind, const std::string& value);
    bool Remove(CatalogKind kind, const std::string& value);
    bool Contains(CatalogKind kind, const std::string& value) const;
    std::vector<std::string> Values(CatalogKind kind) const;

    void Learn(const Lot& lot);

    CatalogSnapshot Snapshot() const;
    void Replace(const CatalogSnapshot& snapshot);

private:
    std::set<std::string>& Bucket(CatalogKind kind);
    const std::set<std::string>& Bucket(CatalogKind kind) const;

    std::set<std::string> brands_;
    std::set<std::string> sizes_;
    std::set<std::string> types_;
};

}  // namespace humidor
