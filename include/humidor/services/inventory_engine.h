#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/core/engine_config.h"
#include "humidor/interfaces/inventory_store.h"
#include "humidor/monitoring/metric_registry.h"
#include "humidor/services/catalog_book.h"
#include "humidor/services/cost_model.h"
#include "humidor/services/lot_store.h"
#include "humidor/services/shipping_calculator.h"
#include "humidor/services/transaction_ledger.h"
#include "humidor/services/valuation_aggregator.h"

namespace humidor {

struct AddLotResult {
    std::string lot_id;
    std::string conflicting_lot_id;
    std::vector<EngineIssue> issues;
    bool persisted{true};
    std::string persist_error;

    bool ok() const { return !lot_id.empty(); }
};

// Outcome of a single-lot mutation. `applied` reports the in-memory change;
// a failed save leaves it applied and sets persisted=false.
struct MutationResult {
    bool applied{false};
    std::optional<EngineIssue> issue;
    bool persisted{true};
    std::string persist_error;
};

// Facade over cost model, lots, ledger, valuation and catalog. Every public
// call is serialized on one mutex and every mutation is followed by a save
// through the inventory store when autosave is on.
class InventoryEngine {
public:
    InventoryEngine(EngineConfig config,
                    std::shared_ptr<IInventoryStore> store,
                    TransactionLedger::Clock clock = nullptr);

    bool Load(std::string* error);
    bool Save(std::string* error);

    double ComputeUnitCost(double price,
                           double shipping,
                           std::int32_t count,
                           std::optional<std::int32_t> original_quantity = std::nullopt) const;
    UnitCostResult EvaluateUnitCostText(const std::string& price,
                                        const std::string& shipping,
                                        const std::string& count) const;
    MutationResult SetTaxRate(double tax_rate);
    double tax_rate() const;

    std::optional<Lot> FindLot(const std::string& lot_id) const;
    std::optional<Lot> FindDuplicateLot(const std::string& brand,
                                        const std::string& name,
                                        const std::string& size,
                                        const std::string& exclude_lot_id = "") const;
    std::vector<Lot> QueryLots(const LotQuery& query) const;
    std::vector<Lot> lots() const;

    MutationResult MergeLots(const std::string& existing_lot_id,
                             std::int32_t new_count,
                             double new_price,
                             double new_shipping,
                             double new_tax = 0.0);

    // A draft colliding with an existing lot is refused with
    // kDuplicateLotConflict; AddLotSeparately suffixes the name instead.
    AddLotResult AddLot(const LotDraft& draft);
    AddLotResult AddLotSeparately(const LotDraft& draft);
    MutationResult RemoveLot(const std::string& lot_id);

    IdentityEditOutcome EditIdentity(const std::string& lot_id, const LotIdentity& identity);
    MutationResult CombineOnEdit(const std::string& edited_lot_id, const std::string& target_lot_id);
    IdentityEditOutcome KeepSeparateOnEdit(const std::string& lot_id, const LotIdentity& identity);
    bool CancelEdit(const std::string& lot_id) const;

    MutationResult UpdateCount(const std::string& lot_id, std::int32_t count);
    MutationResult UpdatePriceText(const std::string& lot_id, const std::string& text);
    MutationResult UpdateShippingText(const std::string& lot_id, const std::string& text);
    MutationResult UpdateRating(const std::string& lot_id, std::optional<int> rating);
    MutationResult UpdateType(const std::string& lot_id, const std::string& type);

    SaleResult RecordSale(const std::vector<SaleItem>& items);
    ResupplyResult RecordResupply(const ResupplyOrder& order);

    ReversalResult ReverseEntry(const std::string& entry_id, std::int32_t quantity);
    ReversalResult ReverseSaleEntry(const std::string& entry_id, std::int32_t quantity);
    ReversalResult ReverseResupplyEntry(const std::string& entry_id, std::int32_t quantity);
    ReversalResult ReverseWholeTransaction(const std::string& transaction_id);

    TransactionState GetTransactionState(const std::string& transaction_id) const;
    std::optional<LedgerEntry> FindEntry(const std::string& entry_id) const;
    std::vector<LedgerEntry> EntriesFor(const std::string& transaction_id) const;
    std::vector<LedgerEntry> SalesHistory() const;
    std::vector<LedgerEntry> entries() const;

    ValuationSummary Aggregate() const;
    SelectionTotal PriceSelection(const std::vector<SaleItem>& items) const;
    static ShippingQuote QuoteShipping(double shipping, std::int64_t total_units);

    bool AddCatalogValue(CatalogKind kind, const std::string& value);
    std::vector<std::string> CatalogValues(CatalogKind kind) const;

    const EngineConfig& config() const;

private:
    struct PersistOutcome {
        bool persisted{true};
        std::string error;
    };

    InventorySnapshot SnapshotLocked() const;
    PersistOutcome PersistLocked(const std::string& operation);
    MutationResult FinishMutation(bool applied,
                                  const EngineIssue& issue,
                                  const std::string& operation,
                                  const std::string& lot_id);
    AddLotResult AddLotLocked(const LotDraft& draft);
    void ApplyTaxRateLocked(double tax_rate);
    ReversalResult FinishReversal(ReversalResult result,
                                  const std::string& operation,
                                  const std::string& target);
    void LogIssues(const std::string& operation, const std::vector<EngineIssue>& issues) const;
    void PublishValuationLocked();

    EngineConfig config_;
    std::shared_ptr<IInventoryStore> store_;
    CostModel cost_model_;
    LotStore lots_;
    TransactionLedger ledger_;
    CatalogBook catalog_;
    TransactionLedger::Clock clock_;

    std::shared_ptr<MonitoringCounter> sales_counter_;
    std::shared_ptr<MonitoringCounter> sale_units_counter_;
    std::shared_ptr<MonitoringCounter> resupply_counter_;
    std::shared_ptr<MonitoringCounter> reversal_counter_;
    std::shared_ptr<MonitoringCounter> skipped_items_counter_;
    std::shared_ptr<MonitoringCounter> persist_failure_counter_;
    std::shared_ptr<MonitoringGauge> inventory_value_gauge_;
    std::shared_ptr<MonitoringGauge> inventory_units_gauge_;

    mutable std::mutex mutex_;
};

}  // namespace humidor
