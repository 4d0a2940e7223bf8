#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/services/cost_model.h"

namespace humidor {

struct LotDraft {
    std::string brand;
    std::string name;
    std::string size;
    std::string type;
    std::int32_t count{0};
    double price{0.0};
    double shipping{0.0};
    double tax{0.0};
    std::optional<std::int32_t> original_quantity;
    std::optional<int> rating;
};

enum class IdentityEditStatus {
    kApplied,
    kConflict,
    kLotNotFound,
};

struct IdentityEditOutcome {
    IdentityEditStatus status{IdentityEditStatus::kLotNotFound};
    std::string lot_id;
    std::string conflicting_lot_id;
    LotIdentity identity;
    bool persisted{true};
    std::string persist_error;
};

enum class LotSortKey {
    kDefault,
    kBrand,
    kName,
    kSize,
    kType,
    kCount,
    kPrice,
    kShipping,
    kUnitCost,
    kRating,
};

struct LotQuery {
    std::string search;
    LotSortKey sort_key{LotSortKey::kDefault};
    bool descending{false};
};

bool ParseLotSortKey(const std::string& text, LotSortKey* key);

bool IdentityMatches(const LotIdentity& lhs, const LotIdentity& rhs);

class LotStore {
public:
    std::string AddLot(const LotDraft& draft, const CostModel& cost_model);
    bool RemoveLot(const std::string& lot_id);

    const Lot* Find(const std::string& lot_id) const;
    Lot* FindMutable(const std::string& lot_id);

    const Lot* FindDuplicate(const std::string& brand,
                             const std::string& name,
                             const std::string& size,
                             const std::string& exclude_lot_id = "") const;

    // Folds an incoming purchase into an existing lot. Totals are summed and
    // the amortization base becomes the combined count; an empty lot is
    // overwritten instead of summed.
    bool MergeInto(const std::string& lot_id,
                   std::int32_t new_count,
                   double new_price,
                   double new_shipping,
                   double new_tax,
                   const CostModel& cost_model,
                   EpochNanos ts_ns);

    IdentityEditOutcome ApplyIdentityEdit(const std::string& lot_id, const LotIdentity& identity);
    bool CombineOnEdit(const std::string& edited_lot_id,
                       const std::string& target_lot_id,
                       const CostModel& cost_model,
                       EpochNanos ts_ns,
                       std::string* error);
    IdentityEditOutcome KeepSeparateOnEdit(const std::string& lot_id, const LotIdentity& identity);
    bool CancelEdit(const std::string& lot_id) const;
    std::string DisambiguatedName(const LotIdentity& identity,
                                  const std::string& exclude_lot_id) const;

    bool UpdateCount(const std::string& lot_id,
                     std::int32_t count,
                     const CostModel& cost_model,
                     EngineIssue* issue);
    bool UpdatePriceText(const std::string& lot_id,
                         const std::string& text,
                         const CostModel& cost_model,
                         EngineIssue* issue);
    bool UpdateShippingText(const std::string& lot_id,
                            const std::string& text,
                            const CostModel& cost_model,
                            EngineIssue* issue);
    bool UpdateRating(const std::string& lot_id, std::optional<int> rating, EngineIssue* issue);
    bool UpdateType(const std::string& lot_id, const std::string& type, EngineIssue* issue);

    void RecomputeAll(const CostModel& cost_model);

    std::vector<Lot> Query(const LotQuery& query) const;
    const std::vector<Lot>& lots() const;
    std::size_t size() const;

    // Loads persisted lots; lots without an id are given one.
    void Replace(std::vector<Lot> lots);

private:
    std::string NextLotId();
    void RebuildIndex();
    static std::uint64_t ParseLotSequence(const std::string& lot_id);

    std::vector<Lot> lots_;
    std::unordered_map<std::string, std::size_t> index_by_id_;
    std::uint64_t next_sequence_{1};
};

}  // namespace humidor
