#include "humidor/services/lot_store.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

#include "humidor/core/numeric_input.h"

namespace humidor {
namespace {

constexpr int kMinRating = 1;
constexpr int kMaxRating = 10;

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool ContainsFolded(const std::string& haystack, const std::string& folded_needle) {
    return Lowercase(haystack).find(folded_needle) != std::string::npos;
}

bool SetIssue(EngineIssue* issue,
              EngineErrorKind kind,
              const std::string& message,
              const std::string& lot_id) {
    if (issue != nullptr) {
        *issue = MakeIssue(kind, message, lot_id);
    }
    return false;
}

bool LotNotFound(EngineIssue* issue, const std::string& lot_id) {
    return SetIssue(issue, EngineErrorKind::kLotNotFound, "unknown lot: " + lot_id, lot_id);
}

// Negative when lhs sorts before rhs.
int CompareBy(LotSortKey key, const Lot& lhs, const Lot& rhs) {
    const auto compare_text = [](const std::string& a, const std::string& b) {
        return Lowercase(a).compare(Lowercase(b));
    };
    const auto compare_number = [](double a, double b) { return a < b ? -1 : (b < a ? 1 : 0); };

    switch (key) {
        case LotSortKey::kBrand:
            return compare_text(lhs.brand, rhs.brand);
        case LotSortKey::kName:
            return compare_text(lhs.name, rhs.name);
        case LotSortKey::kSize:
            return compare_text(lhs.size, rhs.size);
        case LotSortKey::kType:
            return compare_text(lhs.type, rhs.type);
        case LotSortKey::kCount:
            return compare_number(lhs.count, rhs.count);
        case LotSortKey::kPrice:
            return compare_number(lhs.price, rhs.price);
        case LotSortKey::kShipping:
            return compare_number(lhs.shipping(), rhs.shipping());
        case LotSortKey::kUnitCost:
            return compare_number(lhs.unit_cost, rhs.unit_cost);
        case LotSortKey::kRating:
            return compare_number(lhs.rating.value_or(-1), rhs.rating.value_or(-1));
        case LotSortKey::kDefault:
            break;
    }
    const int by_brand = compare_text(lhs.brand, rhs.brand);
    return by_brand != 0 ? by_brand : compare_text(lhs.name, rhs.name);
}

}  // namespace

bool ParseLotSortKey(const std::string& text, LotSortKey* key) {
    if (key == nullptr) {
        return false;
    }
    static const std::unordered_map<std::string, LotSortKey> kKeys = {
        {"", LotSortKey::kDefault},
        {"default", LotSortKey::kDefault},
        {"brand", LotSortKey::kBrand},
        {"name", LotSortKey::kName},
        {"cigar", LotSortKey::kName},
        {"size", LotSortKey::kSize},
        {"type", LotSortKey::kType},
        {"count", LotSortKey::kCount},
        {"price", LotSortKey::kPrice},
        {"shipping", LotSortKey::kShipping},
        {"unit_cost", LotSortKey::kUnitCost},
        {"per_stick", LotSortKey::kUnitCost},
        {"rating", LotSortKey::kRating},
    };
    const auto it = kKeys.find(Lowercase(text));
    if (it == kKeys.end()) {
        return false;
    }
    *key = it->second;
    return true;
}

bool IdentityMatches(const LotIdentity& lhs, const LotIdentity& rhs) {
    return Lowercase(lhs.brand) == Lowercase(rhs.brand) &&
           Lowercase(lhs.name) == Lowercase(rhs.name) &&
           Lowercase(lhs.size) == Lowercase(rhs.size);
}

std::string LotStore::AddLot(const LotDraft& draft, const CostModel& cost_model) {
    Lot lot;
    lot.lot_id = NextLotId();
    lot.brand = draft.brand;
    lot.name = draft.name;
    lot.size = draft.size;
    lot.type = draft.type;
    lot.count = std::max<std::int32_t>(0, draft.count);
    lot.price = draft.price;
    lot.allocated_shipping = draft.shipping;
    lot.allocated_tax = draft.tax;
    lot.original_quantity =
        draft.original_quantity.has_value() ? draft.original_quantity : std::optional(lot.count);
    lot.rating = draft.rating;
    cost_model.Recompute(&lot);

    const auto lot_id = lot.lot_id;
    index_by_id_[lot_id] = lots_.size();
    lots_.push_back(std::move(lot));
    return lot_id;
}

bool LotStore::RemoveLot(const std::string& lot_id) {
    const auto it = index_by_id_.find(lot_id);
    if (it == index_by_id_.end()) {
        return false;
    }
    lots_.erase(lots_.begin() + static_cast<std::ptrdiff_t>(it->second));
    RebuildIndex();
    return true;
}

const Lot* LotStore::Find(const std::string& lot_id) const {
    const auto it = index_by_id_.find(lot_id);
    return it == index_by_id_.end() ? nullptr : &lots_[it->second];
}

Lot* LotStore::FindMutable(const std::string& lot_id) {
    const auto it = index_by_id_.find(lot_id);
    return it == index_by_id_.end() ? nullptr : &lots_[it->second];
}

const Lot* LotStore::FindDuplicate(const std::string& brand,
                                   const std::string& name,
                                   const std::string& size,
                                   const std::string& exclude_lot_id) const {
    const LotIdentity wanted{brand, name, size};
    for (const auto& lot : lots_) {
        if (!exclude_lot_id.empty() && lot.lot_id == exclude_lot_id) {
            continue;
        }
        if (IdentityMatches(lot.identity(), wanted)) {
            return &lot;
        }
    }
    return nullptr;
}

bool LotStore::MergeInto(const std::string& lot_id,
                         std::int32_t new_count,
                         double new_price,
                         double new_shipping,
                         double new_tax,
                         const CostModel& cost_model,
                         EpochNanos ts_ns) {
    auto* lot = FindMutable(lot_id);
    if (lot == nullptr || new_count < 0) {
        return false;
    }

    if (lot->count > 0) {
        lot->count += new_count;
        lot->price += new_price;
        lot->allocated_shipping += new_shipping;
        lot->allocated_tax += new_tax;
    } else {
        lot->count = new_count;
        lot->price = new_price;
        lot->allocated_shipping = new_shipping;
        lot->allocated_tax = new_tax;
    }
    lot->original_quantity = lot->count;
    cost_model.Recompute(lot);

    LotMergeRecord record;
    record.count = new_count;
    record.price = new_price;
    record.shipping = new_shipping;
    record.tax = new_tax;
    record.unit_cost = cost_model.ComputeUnitCost(new_price, new_shipping + new_tax, new_count);
    record.ts_ns = ts_ns;
    lot->history.push_back(record);
    return true;
}

IdentityEditOutcome LotStore::ApplyIdentityEdit(const std::string& lot_id,
                                                const LotIdentity& identity) {
    IdentityEditOutcome outcome;
    outcome.lot_id = lot_id;
    outcome.identity = identity;

    auto* lot = FindMutable(lot_id);
    if (lot == nullptr) {
        outcome.status = IdentityEditStatus::kLotNotFound;
        return outcome;
    }
    if (const auto* other = FindDuplicate(identity.brand, identity.name, identity.size, lot_id);
        other != nullptr) {
        outcome.status = IdentityEditStatus::kConflict;
        outcome.conflicting_lot_id = other->lot_id;
        return outcome;
    }

    lot->brand = identity.brand;
    lot->name = identity.name;
    lot->size = identity.size;
    outcome.status = IdentityEditStatus::kApplied;
    return outcome;
}

bool LotStore::CombineOnEdit(const std::string& edited_lot_id,
                             const std::string& target_lot_id,
                             const CostModel& cost_model,
                             EpochNanos ts_ns,
                             std::string* error) {
    if (edited_lot_id == target_lot_id) {
        if (error != nullptr) {
            *error = "cannot combine a lot with itself";
        }
        return false;
    }
    const auto* edited = Find(edited_lot_id);
    if (edited == nullptr || Find(target_lot_id) == nullptr) {
        if (error != nullptr) {
            *error = "unknown lot for combine";
        }
        return false;
    }

    const auto count = edited->count;
    const auto price = edited->price;
    const auto shipping = edited->allocated_shipping;
    const auto tax = edited->allocated_tax;
    if (!MergeInto(target_lot_id, count, price, shipping, tax, cost_model, ts_ns)) {
        if (error != nullptr) {
            *error = "merge rejected for lot: " + target_lot_id;
        }
        return false;
    }
    return RemoveLot(edited_lot_id);
}

IdentityEditOutcome LotStore::KeepSeparateOnEdit(const std::string& lot_id,
                                                 const LotIdentity& identity) {
    LotIdentity separated = identity;
    separated.name = DisambiguatedName(identity, lot_id);
    return ApplyIdentityEdit(lot_id, separated);
}

bool LotStore::CancelEdit(const std::string& lot_id) const {
    return Find(lot_id) != nullptr;
}

std::string LotStore::DisambiguatedName(const LotIdentity& identity,
                                        const std::string& exclude_lot_id) const {
    if (FindDuplicate(identity.brand, identity.name, identity.size, exclude_lot_id) == nullptr) {
        return identity.name;
    }
    for (int suffix = 2;; ++suffix) {
        std::ostringstream candidate;
        candidate << identity.name << " (" << suffix << ")";
        if (FindDuplicate(identity.brand, candidate.str(), identity.size, exclude_lot_id) ==
            nullptr) {
            return candidate.str();
        }
    }
}

bool LotStore::UpdateCount(const std::string& lot_id,
                           std::int32_t count,
                           const CostModel& cost_model,
                           EngineIssue* issue) {
    auto* lot = FindMutable(lot_id);
    if (lot == nullptr) {
        return LotNotFound(issue, lot_id);
    }
    if (count < 0) {
        return SetIssue(issue,
                        EngineErrorKind::kInvalidNumericInput,
                        "count cannot be negative",
                        lot_id);
    }
    lot->count = count;
    cost_model.Recompute(lot);
    return true;
}

bool LotStore::UpdatePriceText(const std::string& lot_id,
                               const std::string& text,
                               const CostModel& cost_model,
                               EngineIssue* issue) {
    auto* lot = FindMutable(lot_id);
    if (lot == nullptr) {
        return LotNotFound(issue, lot_id);
    }
    double price = 0.0;
    std::string parse_error;
    if (!ParseDecimalText(text, &price, &parse_error) || price < 0.0) {
        return SetIssue(issue,
                        EngineErrorKind::kInvalidNumericInput,
                        parse_error.empty() ? "price cannot be negative" : parse_error,
                        lot_id);
    }
    lot->price = price;
    cost_model.Recompute(lot);
    return true;
}

bool LotStore::UpdateShippingText(const std::string& lot_id,
                                  const std::string& text,
                                  const CostModel& cost_model,
                                  EngineIssue* issue) {
    auto* lot = FindMutable(lot_id);
    if (lot == nullptr) {
        return LotNotFound(issue, lot_id);
    }
    double shipping = 0.0;
    std::string parse_error;
    if (!ParseDecimalText(text, &shipping, &parse_error) || shipping < 0.0) {
        return SetIssue(issue,
                        EngineErrorKind::kInvalidNumericInput,
                        parse_error.empty() ? "shipping cannot be negative" : parse_error,
                        lot_id);
    }
    // A hand-entered figure replaces the combined shipping+tax amount.
    lot->allocated_shipping = shipping;
    lot->allocated_tax = 0.0;
    cost_model.Recompute(lot);
    return true;
}

bool LotStore::UpdateRating(const std::string& lot_id,
                            std::optional<int> rating,
                            EngineIssue* issue) {
    auto* lot = FindMutable(lot_id);
    if (lot == nullptr) {
        return LotNotFound(issue, lot_id);
    }
    if (rating.has_value() && (*rating < kMinRating || *rating > kMaxRating)) {
        return SetIssue(issue,
                        EngineErrorKind::kInvalidNumericInput,
                        "rating must be between 1 and 10",
                        lot_id);
    }
    lot->rating = rating;
    return true;
}

bool LotStore::UpdateType(const std::string& lot_id, const std::string& type, EngineIssue* issue) {
    auto* lot = FindMutable(lot_id);
    if (lot == nullptr) {
        return LotNotFound(issue, lot_id);
    }
    lot->type = type;
    return true;
}

void LotStore::RecomputeAll(const CostModel& cost_model) {
    for (auto& lot : lots_) {
        cost_model.Recompute(&lot);
    }
}

std::vector<Lot> LotStore::Query(const LotQuery& query) const {
    const auto needle = Lowercase(query.search);
    std::vector<Lot> selected;
    selected.reserve(lots_.size());
    for (const auto& lot : lots_) {
        if (!needle.empty() && !ContainsFolded(lot.name, needle) &&
            !ContainsFolded(lot.brand, needle)) {
            continue;
        }
        selected.push_back(lot);
    }

    std::stable_sort(selected.begin(), selected.end(), [&query](const Lot& lhs, const Lot& rhs) {
        const int order = CompareBy(query.sort_key, lhs, rhs);
        return query.descending ? order > 0 : order < 0;
    });
    return selected;
}

const std::vector<Lot>& LotStore::lots() const {
    return lots_;
}

std::size_t LotStore::size() const {
    return lots_.size();
}

void LotStore::Replace(std::vector<Lot> lots) {
    lots_ = std::move(lots);
    next_sequence_ = 1;
    for (const auto& lot : lots_) {
        next_sequence_ = std::max(next_sequence_, ParseLotSequence(lot.lot_id) + 1);
    }
    // A repeated id keeps its first lot; later copies get fresh ids.
    std::set<std::string> seen;
    for (auto& lot : lots_) {
        if (lot.lot_id.empty() || seen.count(lot.lot_id) != 0) {
            lot.lot_id = NextLotId();
        }
        seen.insert(lot.lot_id);
    }
    RebuildIndex();
}

std::string LotStore::NextLotId() {
    std::ostringstream oss;
    oss << "lot-" << std::setw(6) << std::setfill('0') << next_sequence_++;
    return oss.str();
}

void LotStore::RebuildIndex() {
    index_by_id_.clear();
    for (std::size_t i = 0; i < lots_.size(); ++i) {
        index_by_id_[lots_[i].lot_id] = i;
    }
}

std::uint64_t LotStore::ParseLotSequence(const std::string& lot_id) {
    constexpr const char* kPrefix = "lot-";
    if (lot_id.rfind(kPrefix, 0) != 0) {
        return 0;
    }
    const auto digits = lot_id.substr(4);
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        return 0;
    }
    return std::strtoull(digits.c_str(), nullptr, 10);
}

}  // namespace humidor
