#include "humidor/services/catalog_book.h"

#include <algorithm>
#include <cctype>

namespace humidor {
namespace {

std::string Trim(const std::string& value) {
    const auto not_space = [](unsigned char ch) { return std::isspace(ch) == 0; };
    const auto begin = std::find_if(value.begin(), value.end(), not_space);
    const auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

const char* ToString(CatalogKind kind) {
    switch (kind) {
        case CatalogKind::kBrand:
            return "brand";
        case CatalogKind::kSize:
            return "size";
        case CatalogKind::kType:
            return "type";
    }
    return "unknown";
}

bool CatalogBook::Add(CatalogKind kind, const std::string& value) {
    const auto trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }
    return Bucket(kind).insert(trimmed).second;
}

bool CatalogBook::Remove(CatalogKind kind, const std::string& value) {
    return Bucket(kind).erase(Trim(value)) > 0;
}

bool CatalogBook::Contains(CatalogKind kind, const std::string& value) const {
    return Bucket(kind).count(Trim(value)) > 0;
}

std::vector<std::string> CatalogBook::Values(CatalogKind kind) const {
    const auto& bucket = Bucket(kind);
    return std::vector<std::string>(bucket.begin(), bucket.end());
}

void CatalogBook::Learn(const Lot& lot) {
    Add(CatalogKind::kBrand, lot.brand);
    Add(CatalogKind::kSize, lot.size);
    Add(CatalogKind::kType, lot.type);
}

CatalogSnapshot CatalogBook::Snapshot() const {
    CatalogSnapshot snapshot;
    snapshot.brands = Values(CatalogKind::kBrand);
    snapshot.sizes = Values(CatalogKind::kSize);
    snapshot.types = Values(CatalogKind::kType);
    return snapshot;
}

void CatalogBook::Replace(const CatalogSnapshot& snapshot) {
    brands_.clear();
    sizes_.clear();
    types_.clear();
    for (const auto& brand : snapshot.brands) {
        Add(CatalogKind::kBrand, brand);
    }
    for (const auto& size : snapshot.sizes) {
        Add(CatalogKind::kSize, size);
    }
    for (const auto& type : snapshot.types) {
        Add(CatalogKind::kType, type);
    }
}

std::set<std::string>& CatalogBook::Bucket(CatalogKind kind) {
    switch (kind) {
        case CatalogKind::kBrand:
            return brands_;
        case CatalogKind::kSize:
            return sizes_;
        case CatalogKind::kType:
            break;
    }
    return types_;
}

const std::set<std::string>& CatalogBook::Bucket(CatalogKind kind) const {
    switch (kind) {
        case CatalogKind::kBrand:
            return brands_;
        case CatalogKind::kSize:
            return sizes_;
        case CatalogKind::kType:
            break;
    }
    return types_;
}

}  // namespace humidor
