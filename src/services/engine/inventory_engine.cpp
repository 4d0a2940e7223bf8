#include "humidor/services/inventory_engine.h"

#include <cmath>
#include <utility>

#include "humidor/core/fixed_decimal.h"
#include "humidor/core/inventory_codec.h"
#include "humidor/core/structured_log.h"

namespace humidor {
namespace {

constexpr const char* kApp = "humidor_engine";

std::string FormatAmount(double value) {
    return FixedDecimal::FormatMoney(value);
}

}  // namespace

InventoryEngine::InventoryEngine(EngineConfig config,
                                 std::shared_ptr<IInventoryStore> store,
                                 TransactionLedger::Clock clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      cost_model_(config_.default_tax_rate),
      ledger_(clock),
      clock_(std::move(clock)) {
    auto& registry = MetricRegistry::Instance();
    sales_counter_ = registry.BuildCounter("humidor_sales_total", "Recorded sale transactions");
    sale_units_counter_ = registry.BuildCounter("humidor_sale_units_total", "Units sold");
    resupply_counter_ =
        registry.BuildCounter("humidor_resupplies_total", "Recorded resupply orders");
    reversal_counter_ =
        registry.BuildCounter("humidor_reversals_total", "Ledger entries reversed in full or part");
    skipped_items_counter_ =
        registry.BuildCounter("humidor_skipped_items_total", "Sale or resupply items rejected");
    persist_failure_counter_ = registry.BuildCounter("humidor_persistence_failures_total",
                                                     "Failed saves after a mutation");
    inventory_value_gauge_ =
        registry.BuildGauge("humidor_inventory_value", "Sum of unit cost times count");
    inventory_units_gauge_ = registry.BuildGauge("humidor_inventory_units", "Units on hand");
}

bool InventoryEngine::Load(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_ == nullptr) {
        if (error != nullptr) {
            *error = "inventory store is null";
        }
        return false;
    }

    InventorySnapshot snapshot;
    std::string load_error;
    if (!store_->Load(&snapshot, &load_error)) {
        EmitStructuredLog(&config_, kApp, "error", "load_failed", {{"error", load_error}});
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    lots_.Replace(std::move(snapshot.lots));
    lots_.RecomputeAll(cost_model_);
    const auto relinked = InventoryCodec::RelinkEntries(lots_.lots(), &snapshot.entries);
    ledger_.Replace(std::move(snapshot.entries), std::move(snapshot.transactions));
    catalog_.Replace(snapshot.catalog);
    for (const auto& lot : lots_.lots()) {
        catalog_.Learn(lot);
    }
    PublishValuationLocked();

    EmitStructuredLog(&config_,
                      kApp,
                      "info",
                      "engine_loaded",
                      {{"lots", std::to_string(lots_.size())},
                       {"entries", std::to_string(ledger_.entries().size())},
                       {"relinked_entries", std::to_string(relinked)}});
    return true;
}

bool InventoryEngine::Save(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_ == nullptr) {
        if (error != nullptr) {
            *error = "inventory store is null";
        }
        return false;
    }
    std::string save_error;
    if (!store_->Save(SnapshotLocked(), &save_error)) {
        persist_failure_counter_->Increment();
        EmitStructuredLog(&config_, kApp, "error", "persist_failed", {{"operation", "save"},
                                                                      {"error", save_error}});
        if (error != nullptr) {
            *error = save_error;
        }
        return false;
    }
    return true;
}

double InventoryEngine::ComputeUnitCost(double price,
                                        double shipping,
                                        std::int32_t count,
                                        std::optional<std::int32_t> original_quantity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cost_model_.ComputeUnitCost(price, shipping, count, original_quantity);
}

UnitCostResult InventoryEngine::EvaluateUnitCostText(const std::string& price,
                                                     const std::string& shipping,
                                                     const std::string& count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cost_model_.EvaluateText(price, shipping, count);
}

MutationResult InventoryEngine::SetTaxRate(double tax_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    double normalized = 0.0;
    if (!CostModel::NormalizeTaxRate(tax_rate, &normalized)) {
        return FinishMutation(false,
                              MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                        "tax rate must be a non-negative number"),
                              "set_tax_rate",
                              "");
    }
    ApplyTaxRateLocked(normalized);
    return FinishMutation(true, EngineIssue{}, "set_tax_rate", "");
}

double InventoryEngine::tax_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cost_model_.tax_rate();
}

std::optional<Lot> InventoryEngine::FindLot(const std::string& lot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* lot = lots_.Find(lot_id);
    return lot == nullptr ? std::nullopt : std::optional<Lot>(*lot);
}

std::optional<Lot> InventoryEngine::FindDuplicateLot(const std::string& brand,
                                                     const std::string& name,
                                                     const std::string& size,
                                                     const std::string& exclude_lot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* lot = lots_.FindDuplicate(brand, name, size, exclude_lot_id);
    return lot == nullptr ? std::nullopt : std::optional<Lot>(*lot);
}

std::vector<Lot> InventoryEngine::QueryLots(const LotQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lots_.Query(query);
}

std::vector<Lot> InventoryEngine::lots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lots_.lots();
}

MutationResult InventoryEngine::MergeLots(const std::string& existing_lot_id,
                                          std::int32_t new_count,
                                          double new_price,
                                          double new_shipping,
                                          double new_tax) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lots_.Find(existing_lot_id) == nullptr) {
        return FinishMutation(false,
                              MakeIssue(EngineErrorKind::kLotNotFound,
                                        "unknown lot: " + existing_lot_id,
                                        existing_lot_id),
                              "merge_lots",
                              existing_lot_id);
    }
    const auto valid = [](double value) { return std::isfinite(value) && value >= 0.0; };
    if (new_count < 0 || !valid(new_price) || !valid(new_shipping) || !valid(new_tax)) {
        return FinishMutation(false,
                              MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                        "merge values must be non-negative numbers",
                                        existing_lot_id),
                              "merge_lots",
                              existing_lot_id);
    }
    const auto ts_ns = clock_ ? clock_() : NowEpochNanos();
    lots_.MergeInto(
        existing_lot_id, new_count, new_price, new_shipping, new_tax, cost_model_, ts_ns);
    return FinishMutation(true, EngineIssue{}, "merge_lots", existing_lot_id);
}

AddLotResult InventoryEngine::AddLot(const LotDraft& draft) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* existing = lots_.FindDuplicate(draft.brand, draft.name, draft.size);
        existing != nullptr) {
        AddLotResult result;
        result.conflicting_lot_id = existing->lot_id;
        result.issues.push_back(MakeIssue(EngineErrorKind::kDuplicateLotConflict,
                                          "a lot with this brand, name and size already exists",
                                          existing->lot_id));
        LogIssues("add_lot", result.issues);
        return result;
    }
    return AddLotLocked(draft);
}

AddLotResult InventoryEngine::AddLotSeparately(const LotDraft& draft) {
    std::lock_guard<std::mutex> lock(mutex_);
    LotDraft separated = draft;
    separated.name = lots_.DisambiguatedName(LotIdentity{draft.brand, draft.name, draft.size}, "");
    return AddLotLocked(separated);
}

MutationResult InventoryEngine::RemoveLot(const std::string& lot_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!lots_.RemoveLot(lot_id)) {
        return FinishMutation(false,
                              MakeIssue(EngineErrorKind::kLotNotFound, "unknown lot: " + lot_id, lot_id),
                              "remove_lot",
                              lot_id);
    }
    return FinishMutation(true, EngineIssue{}, "remove_lot", lot_id);
}

IdentityEditOutcome InventoryEngine::EditIdentity(const std::string& lot_id,
                                                  const LotIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto outcome = lots_.ApplyIdentityEdit(lot_id, identity);
    if (outcome.status == IdentityEditStatus::kApplied) {
        if (const auto* lot = lots_.Find(lot_id); lot != nullptr) {
            catalog_.Learn(*lot);
        }
        const auto persisted = PersistLocked("edit_identity");
        outcome.persisted = persisted.persisted;
        outcome.persist_error = persisted.error;
    } else if (outcome.status == IdentityEditStatus::kConflict) {
        EmitStructuredLog(&config_,
                          kApp,
                          "info",
                          "identity_edit_conflict",
                          {{"lot_id", lot_id}, {"conflicting_lot_id", outcome.conflicting_lot_id}});
    }
    return outcome;
}

MutationResult InventoryEngine::CombineOnEdit(const std::string& edited_lot_id,
                                              const std::string& target_lot_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto ts_ns = clock_ ? clock_() : NowEpochNanos();
    std::string error;
    if (!lots_.CombineOnEdit(edited_lot_id, target_lot_id, cost_model_, ts_ns, &error)) {
        auto kind = EngineErrorKind::kInvalidNumericInput;
        if (edited_lot_id == target_lot_id) {
            kind = EngineErrorKind::kDuplicateLotConflict;
        } else if (lots_.Find(edited_lot_id) == nullptr || lots_.Find(target_lot_id) == nullptr) {
            kind = EngineErrorKind::kLotNotFound;
        }
        return FinishMutation(
            false, MakeIssue(kind, error, edited_lot_id), "combine_on_edit", edited_lot_id);
    }
    ledger_.RelinkLot(edited_lot_id, target_lot_id);
    return FinishMutation(true, EngineIssue{}, "combine_on_edit", target_lot_id);
}

IdentityEditOutcome InventoryEngine::KeepSeparateOnEdit(const std::string& lot_id,
                                                        const LotIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto outcome = lots_.KeepSeparateOnEdit(lot_id, identity);
    if (outcome.status == IdentityEditStatus::kApplied) {
        if (const auto* lot = lots_.Find(lot_id); lot != nullptr) {
            catalog_.Learn(*lot);
        }
        const auto persisted = PersistLocked("keep_separate_on_edit");
        outcome.persisted = persisted.persisted;
        outcome.persist_error = persisted.error;
    }
    return outcome;
}

bool InventoryEngine::CancelEdit(const std::string& lot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lots_.CancelEdit(lot_id);
}

MutationResult InventoryEngine::UpdateCount(const std::string& lot_id, std::int32_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    EngineIssue issue;
    const bool applied = lots_.UpdateCount(lot_id, count, cost_model_, &issue);
    return FinishMutation(applied, issue, "update_count", lot_id);
}

MutationResult InventoryEngine::UpdatePriceText(const std::string& lot_id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    EngineIssue issue;
    const bool applied = lots_.UpdatePriceText(lot_id, text, cost_model_, &issue);
    return FinishMutation(applied, issue, "update_price", lot_id);
}

MutationResult InventoryEngine::UpdateShippingText(const std::string& lot_id,
                                                   const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    EngineIssue issue;
    const bool applied = lots_.UpdateShippingText(lot_id, text, cost_model_, &issue);
    return FinishMutation(applied, issue, "update_shipping", lot_id);
}

MutationResult InventoryEngine::UpdateRating(const std::string& lot_id, std::optional<int> rating) {
    std::lock_guard<std::mutex> lock(mutex_);
    EngineIssue issue;
    const bool applied = lots_.UpdateRating(lot_id, rating, &issue);
    return FinishMutation(applied, issue, "update_rating", lot_id);
}

MutationResult InventoryEngine::UpdateType(const std::string& lot_id, const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    EngineIssue issue;
    const bool applied = lots_.UpdateType(lot_id, type, &issue);
    if (applied) {
        catalog_.Add(CatalogKind::kType, type);
    }
    return FinishMutation(applied, issue, "update_type", lot_id);
}

SaleResult InventoryEngine::RecordSale(const std::vector<SaleItem>& items) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = ledger_.RecordSale(items, &lots_, cost_model_);
    skipped_items_counter_->Increment(static_cast<double>(result.issues.size()));
    LogIssues("record_sale", result.issues);
    if (result.entries.empty()) {
        return result;
    }

    std::int64_t units = 0;
    double revenue = 0.0;
    for (const auto& entry : result.entries) {
        units += entry.quantity;
        revenue += entry.total_cost;
    }
    sales_counter_->Increment();
    sale_units_counter_->Increment(static_cast<double>(units));
    EmitStructuredLog(&config_,
                      kApp,
                      "info",
                      "sale_recorded",
                      {{"transaction_id", result.transaction_id},
                       {"entries", std::to_string(result.entries.size())},
                       {"units", std::to_string(units)},
                       {"total", FormatAmount(revenue)}});

    const auto persisted = PersistLocked("record_sale");
    result.persisted = persisted.persisted;
    result.persist_error = persisted.error;
    return result;
}

ResupplyResult InventoryEngine::RecordResupply(const ResupplyOrder& order) {
    std::lock_guard<std::mutex> lock(mutex_);

    // The order is priced at its own rate, which becomes the current rate
    // once anything from it has been booked.
    // The ledger refuses rates above 100%.
    CostModel order_model(cost_model_.tax_rate());
    const double order_rate = order.tax_rate_percent / 100.0;
    const bool rate_valid = std::isfinite(order_rate) && order_rate >= 0.0 && order_rate <= 1.0;
    if (rate_valid) {
        order_model.SetTaxRate(order_rate);
    }

    auto result = ledger_.RecordResupply(order, &lots_, order_model);
    skipped_items_counter_->Increment(static_cast<double>(result.issues.size()));
    LogIssues("record_resupply", result.issues);
    if (result.entries.empty()) {
        return result;
    }

    if (rate_valid) {
        ApplyTaxRateLocked(order_rate);
    }
    for (const auto& lot_id : result.lot_ids) {
        if (const auto* lot = lots_.Find(lot_id); lot != nullptr) {
            catalog_.Learn(*lot);
        }
    }

    std::int64_t units = 0;
    for (const auto& entry : result.entries) {
        units += entry.quantity;
    }
    resupply_counter_->Increment();
    EmitStructuredLog(&config_,
                      kApp,
                      "info",
                      "resupply_recorded",
                      {{"order_id", result.order_id},
                       {"entries", std::to_string(result.entries.size())},
                       {"units", std::to_string(units)},
                       {"shipping", FormatAmount(order.total_shipping)},
                       {"tax_rate_percent", std::to_string(order.tax_rate_percent)}});

    const auto persisted = PersistLocked("record_resupply");
    result.persisted = persisted.persisted;
    result.persist_error = persisted.error;
    return result;
}

ReversalResult InventoryEngine::ReverseEntry(const std::string& entry_id, std::int32_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FinishReversal(
        ledger_.ReverseEntry(entry_id, quantity, &lots_, cost_model_), "reverse_entry", entry_id);
}

ReversalResult InventoryEngine::ReverseSaleEntry(const std::string& entry_id,
                                                 std::int32_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FinishReversal(ledger_.ReverseSaleEntry(entry_id, quantity, &lots_, cost_model_),
                          "reverse_sale_entry",
                          entry_id);
}

ReversalResult InventoryEngine::ReverseResupplyEntry(const std::string& entry_id,
                                                     std::int32_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FinishReversal(ledger_.ReverseResupplyEntry(entry_id, quantity, &lots_, cost_model_),
                          "reverse_resupply_entry",
                          entry_id);
}

ReversalResult InventoryEngine::ReverseWholeTransaction(const std::string& transaction_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FinishReversal(ledger_.ReverseTransaction(transaction_id, &lots_, cost_model_),
                          "reverse_transaction",
                          transaction_id);
}

TransactionState InventoryEngine::GetTransactionState(const std::string& transaction_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetTransactionState(transaction_id);
}

std::optional<LedgerEntry> InventoryEngine::FindEntry(const std::string& entry_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entry = ledger_.FindEntry(entry_id);
    return entry == nullptr ? std::nullopt : std::optional<LedgerEntry>(*entry);
}

std::vector<LedgerEntry> InventoryEngine::EntriesFor(const std::string& transaction_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.EntriesFor(transaction_id);
}

std::vector<LedgerEntry> InventoryEngine::SalesHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.SalesHistory();
}

std::vector<LedgerEntry> InventoryEngine::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.entries();
}

ValuationSummary InventoryEngine::Aggregate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ValuationAggregator(&lots_).Aggregate();
}

SelectionTotal InventoryEngine::PriceSelection(const std::vector<SaleItem>& items) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ValuationAggregator(&lots_).PriceSelection(items);
}

ShippingQuote InventoryEngine::QuoteShipping(double shipping, std::int64_t total_units) {
    return ShippingCalculator::Quote(shipping, total_units);
}

bool InventoryEngine::AddCatalogValue(CatalogKind kind, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!catalog_.Add(kind, value)) {
        return false;
    }
    const auto persisted = PersistLocked("add_catalog_value");
    return persisted.persisted || !config_.autosave;
}

std::vector<std::string> InventoryEngine::CatalogValues(CatalogKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_.Values(kind);
}

const EngineConfig& InventoryEngine::config() const {
    return config_;
}

InventorySnapshot InventoryEngine::SnapshotLocked() const {
    InventorySnapshot snapshot;
    snapshot.lots = lots_.lots();
    snapshot.entries = ledger_.entries();
    snapshot.transactions = ledger_.transactions();
    snapshot.catalog = catalog_.Snapshot();
    return snapshot;
}

InventoryEngine::PersistOutcome InventoryEngine::PersistLocked(const std::string& operation) {
    PublishValuationLocked();
    PersistOutcome outcome;
    if (!config_.autosave) {
        outcome.persisted = false;
        return outcome;
    }
    if (store_ == nullptr) {
        outcome.persisted = false;
        outcome.error = "inventory store is null";
    } else if (!store_->Save(SnapshotLocked(), &outcome.error)) {
        outcome.persisted = false;
    }
    if (!outcome.persisted) {
        persist_failure_counter_->Increment();
        EmitStructuredLog(&config_,
                          kApp,
                          "error",
                          "persist_failed",
                          {{"operation", operation}, {"error", outcome.error}});
    }
    return outcome;
}

MutationResult InventoryEngine::FinishMutation(bool applied,
                                               const EngineIssue& issue,
                                               const std::string& operation,
                                               const std::string& lot_id) {
    MutationResult result;
    result.applied = applied;
    if (!applied) {
        result.issue = issue;
        LogIssues(operation, {issue});
        return result;
    }
    EmitStructuredLog(&config_, kApp, "info", operation, {{"lot_id", lot_id}});
    const auto persisted = PersistLocked(operation);
    result.persisted = persisted.persisted;
    result.persist_error = persisted.error;
    if (!persisted.persisted && !persisted.error.empty()) {
        result.issue = MakeIssue(EngineErrorKind::kPersistenceFailure, persisted.error, lot_id);
    }
    return result;
}

AddLotResult InventoryEngine::AddLotLocked(const LotDraft& draft) {
    AddLotResult result;
    const auto valid = [](double value) { return std::isfinite(value) && value >= 0.0; };
    if (draft.count < 0 || !valid(draft.price) || !valid(draft.shipping) || !valid(draft.tax)) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                          "count, price and shipping must be non-negative"));
        LogIssues("add_lot", result.issues);
        return result;
    }
    if (draft.rating.has_value() && (*draft.rating < 1 || *draft.rating > 10)) {
        result.issues.push_back(
            MakeIssue(EngineErrorKind::kInvalidNumericInput, "rating must be between 1 and 10"));
        LogIssues("add_lot", result.issues);
        return result;
    }

    result.lot_id = lots_.AddLot(draft, cost_model_);
    if (const auto* lot = lots_.Find(result.lot_id); lot != nullptr) {
        catalog_.Learn(*lot);
    }
    EmitStructuredLog(&config_,
                      kApp,
                      "info",
                      "lot_added",
                      {{"lot_id", result.lot_id}, {"brand", draft.brand}, {"name", draft.name}});
    const auto persisted = PersistLocked("add_lot");
    result.persisted = persisted.persisted;
    result.persist_error = persisted.error;
    return result;
}

void InventoryEngine::ApplyTaxRateLocked(double tax_rate) {
    const double previous = cost_model_.tax_rate();
    cost_model_.SetTaxRate(tax_rate);
    lots_.RecomputeAll(cost_model_);
    if (previous != cost_model_.tax_rate()) {
        EmitStructuredLog(&config_,
                          kApp,
                          "info",
                          "tax_rate_updated",
                          {{"previous", std::to_string(previous)},
                           {"current", std::to_string(cost_model_.tax_rate())}});
    }
}

ReversalResult InventoryEngine::FinishReversal(ReversalResult result,
                                               const std::string& operation,
                                               const std::string& target) {
    LogIssues(operation, result.issues);
    if (result.entries_reversed == 0) {
        return result;
    }
    reversal_counter_->Increment(static_cast<double>(result.entries_reversed));
    EmitStructuredLog(&config_,
                      kApp,
                      "info",
                      "reversal_applied",
                      {{"operation", operation},
                       {"target", target},
                       {"entries", std::to_string(result.entries_reversed)},
                       {"quantity", std::to_string(result.quantity_reversed)}});
    const auto persisted = PersistLocked(operation);
    result.persisted = persisted.persisted;
    result.persist_error = persisted.error;
    return result;
}

void InventoryEngine::LogIssues(const std::string& operation,
                                const std::vector<EngineIssue>& issues) const {
    for (const auto& issue : issues) {
        EmitStructuredLog(&config_,
                          kApp,
                          "warn",
                          "item_rejected",
                          {{"operation", operation},
                           {"kind", ToString(issue.kind)},
                           {"lot_id", issue.lot_id},
                           {"transaction_id", issue.transaction_id},
                           {"entry_id", issue.entry_id},
                           {"message", issue.message}});
    }
}

void InventoryEngine::PublishValuationLocked() {
    const auto summary = ValuationAggregator(&lots_).Aggregate();
    inventory_value_gauge_->Set(summary.total_value);
    inventory_units_gauge_->Set(static_cast<double>(summary.total_count));
}

}  // namespace humidor
