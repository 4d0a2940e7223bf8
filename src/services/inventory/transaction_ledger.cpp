#include "humidor/services/transaction_ledger.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

#include "humidor/common/timestamp.h"

namespace humidor {
namespace {

bool IsNonNegativeFinite(double value) {
    return std::isfinite(value) && value >= 0.0;
}

std::string DescribeLot(const Lot& lot) {
    return lot.brand.empty() ? lot.name : lot.brand + " " + lot.name;
}

}  // namespace

TransactionLedger::TransactionLedger(Clock clock) : clock_(std::move(clock)) {}

SaleResult TransactionLedger::RecordSale(const std::vector<SaleItem>& items,
                                         LotStore* lots,
                                         const CostModel& cost_model) {
    SaleResult result;
    if (lots == nullptr) {
        result.issues.push_back(
            MakeIssue(EngineErrorKind::kLotNotFound, "lot store is null"));
        return result;
    }

    const auto ts_ns = Now();
    std::vector<LedgerEntry> pending;
    for (const auto& item : items) {
        auto* lot = lots->FindMutable(item.lot_id);
        if (lot == nullptr) {
            result.issues.push_back(MakeIssue(
                EngineErrorKind::kLotNotFound, "unknown lot: " + item.lot_id, item.lot_id));
            continue;
        }
        if (item.quantity < 1) {
            result.issues.push_back(MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                              "sale quantity for " + DescribeLot(*lot) +
                                                  " must be at least 1",
                                              item.lot_id));
            continue;
        }
        if (lot->count < item.quantity) {
            result.issues.push_back(MakeIssue(EngineErrorKind::kInsufficientStock,
                                              "not enough stock for " + DescribeLot(*lot) +
                                                  ", only " + std::to_string(lot->count) +
                                                  " available",
                                              item.lot_id));
            continue;
        }

        // Captured before the count changes so later recomputation never
        // rewrites historical revenue.
        const double unit_price = lot->unit_cost;
        lot->count -= item.quantity;
        cost_model.Recompute(lot);

        LedgerEntry entry;
        entry.ts_ns = ts_ns;
        entry.kind = LedgerEntryKind::kSale;
        entry.lot_id = lot->lot_id;
        entry.brand = lot->brand;
        entry.name = lot->name;
        entry.size = lot->size;
        entry.unit_price = unit_price;
        entry.quantity = item.quantity;
        entry.total_cost = unit_price * static_cast<double>(item.quantity);
        pending.push_back(std::move(entry));
    }

    if (pending.empty()) {
        return result;
    }

    TransactionRecord record;
    record.transaction_id = NextTransactionId(LedgerEntryKind::kSale, ts_ns);
    record.kind = LedgerEntryKind::kSale;
    record.ts_ns = ts_ns;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        pending[i].transaction_id = record.transaction_id;
        pending[i].entry_id = BuildEntryId(record.transaction_id, i);
        record.recorded_quantity += pending[i].quantity;
    }
    transactions_[record.transaction_id] = record;
    entries_.insert(entries_.end(), pending.begin(), pending.end());

    result.transaction_id = record.transaction_id;
    result.entries = std::move(pending);
    return result;
}

ResupplyResult TransactionLedger::RecordResupply(const ResupplyOrder& order,
                                                 LotStore* lots,
                                                 const CostModel& cost_model) {
    ResupplyResult result;
    if (lots == nullptr) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kLotNotFound, "lot store is null"));
        return result;
    }
    if (!IsNonNegativeFinite(order.total_shipping)) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                          "order shipping must be a non-negative number"));
        return result;
    }
    if (!IsNonNegativeFinite(order.tax_rate_percent) || order.tax_rate_percent > 100.0) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                          "tax rate must be between 0 and 100 percent"));
        return result;
    }

    std::vector<const ResupplyItem*> valid_items;
    std::int64_t total_units = 0;
    for (const auto& item : order.items) {
        if (item.count < 1 || !IsNonNegativeFinite(item.price)) {
            result.issues.push_back(MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                              "invalid count or price for " + item.brand + " " +
                                                  item.name));
            continue;
        }
        valid_items.push_back(&item);
        total_units += item.count;
    }
    if (valid_items.empty()) {
        return result;
    }

    const auto ts_ns = Now();
    const double shipping_per_unit =
        total_units > 0 ? order.total_shipping / static_cast<double>(total_units) : 0.0;
    const double tax_rate = order.tax_rate_percent / 100.0;

    std::vector<LedgerEntry> pending;
    for (const auto* item : valid_items) {
        const double shipping = shipping_per_unit * static_cast<double>(item->count);
        // Tax applies to the base price only, never to shipping.
        const double tax = item->price * tax_rate;
        const double unit_cost_at_order =
            cost_model.ComputeUnitCost(item->price, shipping + tax, item->count, item->count);

        std::string lot_id;
        if (const auto* existing = lots->FindDuplicate(item->brand, item->name, item->size);
            existing != nullptr) {
            lot_id = existing->lot_id;
            lots->MergeInto(lot_id, item->count, item->price, shipping, tax, cost_model, ts_ns);
        } else {
            LotDraft draft;
            draft.brand = item->brand;
            draft.name = item->name;
            draft.size = item->size;
            draft.type = item->type;
            draft.count = item->count;
            draft.price = item->price;
            draft.shipping = shipping;
            draft.tax = tax;
            draft.original_quantity = item->count;
            lot_id = lots->AddLot(draft, cost_model);
        }

        LedgerEntry entry;
        entry.ts_ns = ts_ns;
        entry.kind = LedgerEntryKind::kResupply;
        entry.lot_id = lot_id;
        entry.brand = item->brand;
        entry.name = item->name;
        entry.size = item->size;
        entry.unit_price = unit_cost_at_order;
        entry.quantity = item->count;
        entry.total_cost = unit_cost_at_order * static_cast<double>(item->count);
        entry.total_price = item->price;
        entry.shipping_allocated = shipping;
        entry.tax_allocated = tax;
        pending.push_back(std::move(entry));
        result.lot_ids.push_back(lot_id);
    }

    TransactionRecord record;
    record.transaction_id = NextTransactionId(LedgerEntryKind::kResupply, ts_ns);
    record.kind = LedgerEntryKind::kResupply;
    record.ts_ns = ts_ns;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        pending[i].transaction_id = record.transaction_id;
        pending[i].entry_id = BuildEntryId(record.transaction_id, i);
        record.recorded_quantity += pending[i].quantity;
    }
    transactions_[record.transaction_id] = record;
    entries_.insert(entries_.end(), pending.begin(), pending.end());

    result.order_id = record.transaction_id;
    result.entries = std::move(pending);
    return result;
}

ReversalResult TransactionLedger::ReverseEntry(const std::string& entry_id,
                                               std::int32_t quantity,
                                               LotStore* lots,
                                               const CostModel& cost_model) {
    return ReverseEntryChecked(entry_id, quantity, nullptr, lots, cost_model);
}

ReversalResult TransactionLedger::ReverseSaleEntry(const std::string& entry_id,
                                                   std::int32_t quantity,
                                                   LotStore* lots,
                                                   const CostModel& cost_model) {
    const auto kind = LedgerEntryKind::kSale;
    return ReverseEntryChecked(entry_id, quantity, &kind, lots, cost_model);
}

ReversalResult TransactionLedger::ReverseResupplyEntry(const std::string& entry_id,
                                                       std::int32_t quantity,
                                                       LotStore* lots,
                                                       const CostModel& cost_model) {
    const auto kind = LedgerEntryKind::kResupply;
    return ReverseEntryChecked(entry_id, quantity, &kind, lots, cost_model);
}

ReversalResult TransactionLedger::ReverseTransaction(const std::string& transaction_id,
                                                     LotStore* lots,
                                                     const CostModel& cost_model) {
    ReversalResult result;
    std::vector<std::pair<std::string, std::int32_t>> targets;
    for (const auto& entry : entries_) {
        if (entry.transaction_id == transaction_id) {
            targets.emplace_back(entry.entry_id, entry.quantity);
        }
    }
    if (targets.empty()) {
        const bool known = transactions_.find(transaction_id) != transactions_.end();
        result.issues.push_back(MakeIssue(EngineErrorKind::kReversalNotFound,
                                          known ? "transaction already fully reversed: " +
                                                      transaction_id
                                                : "unknown transaction: " + transaction_id,
                                          "",
                                          transaction_id));
        return result;
    }

    for (const auto& [entry_id, quantity] : targets) {
        auto partial = ReverseEntryChecked(entry_id, quantity, nullptr, lots, cost_model);
        result.entries_reversed += partial.entries_reversed;
        result.quantity_reversed += partial.quantity_reversed;
        result.issues.insert(result.issues.end(), partial.issues.begin(), partial.issues.end());
    }
    return result;
}

TransactionState TransactionLedger::GetTransactionState(const std::string& transaction_id) const {
    const auto it = transactions_.find(transaction_id);
    if (it == transactions_.end()) {
        return TransactionState::kUnknown;
    }
    std::int32_t remaining = 0;
    for (const auto& entry : entries_) {
        if (entry.transaction_id == transaction_id) {
            remaining += entry.quantity;
        }
    }
    if (remaining <= 0) {
        return TransactionState::kFullyReversed;
    }
    if (remaining >= it->second.recorded_quantity) {
        return TransactionState::kRecorded;
    }
    return TransactionState::kPartiallyReversed;
}

const LedgerEntry* TransactionLedger::FindEntry(const std::string& entry_id) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(), [&entry_id](const auto& entry) {
        return entry.entry_id == entry_id;
    });
    return it == entries_.end() ? nullptr : &*it;
}

std::vector<LedgerEntry> TransactionLedger::EntriesFor(const std::string& transaction_id) const {
    std::vector<LedgerEntry> out;
    std::copy_if(entries_.begin(),
                 entries_.end(),
                 std::back_inserter(out),
                 [&transaction_id](const auto& entry) {
                     return entry.transaction_id == transaction_id;
                 });
    return out;
}

std::vector<LedgerEntry> TransactionLedger::SalesHistory() const {
    std::vector<LedgerEntry> out;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->kind == LedgerEntryKind::kSale) {
            out.push_back(*it);
        }
    }
    return out;
}

const std::vector<LedgerEntry>& TransactionLedger::entries() const {
    return entries_;
}

std::vector<TransactionRecord> TransactionLedger::transactions() const {
    std::vector<TransactionRecord> out;
    out.reserve(transactions_.size());
    for (const auto& [id, record] : transactions_) {
        out.push_back(record);
    }
    return out;
}

std::size_t TransactionLedger::RelinkLot(const std::string& from_lot_id,
                                      const std::string& to_lot_id) {
    std::size_t relinked = 0;
    for (auto& entry : entries_) {
        if (entry.lot_id == from_lot_id) {
            entry.lot_id = to_lot_id;
            ++relinked;
        }
    }
    return relinked;
}

void TransactionLedger::Replace(std::vector<LedgerEntry> entries,
                                std::vector<TransactionRecord> transactions) {
    entries_ = std::move(entries);
    transactions_.clear();
    for (auto& record : transactions) {
        if (!record.transaction_id.empty()) {
            transactions_[record.transaction_id] = record;
        }
    }

    std::set<std::string> used_entry_ids;
    for (const auto& entry : entries_) {
        if (!entry.entry_id.empty()) {
            used_entry_ids.insert(entry.entry_id);
        }
    }

    std::map<std::string, std::int32_t> surviving_quantity;
    std::map<std::string, std::size_t> next_index;
    std::size_t undated = 0;
    for (auto& entry : entries_) {
        if (entry.transaction_id.empty()) {
            entry.transaction_id = "legacy-" + Timestamp(entry.ts_ns).ToCompact();
            // Undated entries each get their own transaction.
            if (entry.ts_ns == 0) {
                do {
                    entry.transaction_id =
                        "legacy-" + Timestamp(0).ToCompact() + "-" + std::to_string(++undated);
                } while (transactions_.find(entry.transaction_id) != transactions_.end());
            }
        }
        if (entry.entry_id.empty()) {
            auto& index = next_index[entry.transaction_id];
            std::string candidate = BuildEntryId(entry.transaction_id, index++);
            while (used_entry_ids.count(candidate) != 0) {
                candidate = BuildEntryId(entry.transaction_id, index++);
            }
            entry.entry_id = candidate;
            used_entry_ids.insert(candidate);
        }
        surviving_quantity[entry.transaction_id] += entry.quantity;
        if (transactions_.find(entry.transaction_id) == transactions_.end()) {
            TransactionRecord record;
            record.transaction_id = entry.transaction_id;
            record.kind = entry.kind;
            record.ts_ns = entry.ts_ns;
            transactions_[entry.transaction_id] = record;
        }
    }

    for (auto& [id, record] : transactions_) {
        const auto it = surviving_quantity.find(id);
        if (it != surviving_quantity.end()) {
            record.recorded_quantity = std::max(record.recorded_quantity, it->second);
        }
    }
}

EpochNanos TransactionLedger::Now() const {
    return clock_ ? clock_() : NowEpochNanos();
}

std::string TransactionLedger::NextTransactionId(LedgerEntryKind kind, EpochNanos ts_ns) {
    const char* prefix = kind == LedgerEntryKind::kSale ? "S" : "R";
    const auto stamp = Timestamp(ts_ns).ToCompact();
    while (true) {
        std::ostringstream oss;
        oss << prefix << '-' << stamp << '-' << std::setw(4) << std::setfill('0')
            << next_sequence_++;
        if (transactions_.find(oss.str()) == transactions_.end()) {
            return oss.str();
        }
    }
}

std::string TransactionLedger::BuildEntryId(const std::string& transaction_id, std::size_t index) {
    return transaction_id + "/" + std::to_string(index + 1);
}

ReversalResult TransactionLedger::ReverseEntryChecked(const std::string& entry_id,
                                                      std::int32_t quantity,
                                                      const LedgerEntryKind* expected_kind,
                                                      LotStore* lots,
                                                      const CostModel& cost_model) {
    ReversalResult result;
    auto it = FindEntryIt(entry_id);
    if (it == entries_.end()) {
        result.issues.push_back(MakeIssue(
            EngineErrorKind::kReversalNotFound, "no ledger entry: " + entry_id, "", "", entry_id));
        return result;
    }
    if (expected_kind != nullptr && it->kind != *expected_kind) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kReversalNotFound,
                                          "entry " + entry_id + " is not a " +
                                              ToString(*expected_kind) + " entry",
                                          it->lot_id,
                                          it->transaction_id,
                                          entry_id));
        return result;
    }
    if (quantity < 1 || quantity > it->quantity) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kInvalidNumericInput,
                                          "reversal quantity must be between 1 and " +
                                              std::to_string(it->quantity),
                                          it->lot_id,
                                          it->transaction_id,
                                          entry_id));
        return result;
    }

    Lot* lot = lots == nullptr ? nullptr : lots->FindMutable(it->lot_id);
    if (lot == nullptr) {
        result.issues.push_back(MakeIssue(EngineErrorKind::kLotNotFound,
                                          "lot for entry " + entry_id + " no longer exists",
                                          it->lot_id,
                                          it->transaction_id,
                                          entry_id));
        return result;
    }

    if (it->kind == LedgerEntryKind::kResupply) {
        if (lot->count < quantity) {
            result.issues.push_back(MakeIssue(EngineErrorKind::kInsufficientStock,
                                              "cannot remove " + std::to_string(quantity) +
                                                  " from " + DescribeLot(*lot) + ", only " +
                                                  std::to_string(lot->count) + " in stock",
                                              lot->lot_id,
                                              it->transaction_id,
                                              entry_id));
            return result;
        }
        // The reversed share of the purchase leaves the lot's cost basis too.
        const double share = static_cast<double>(quantity) / static_cast<double>(it->quantity);
        lot->count -= quantity;
        lot->price = std::max(0.0, lot->price - it->total_price * share);
        lot->allocated_shipping =
            std::max(0.0, lot->allocated_shipping - it->shipping_allocated * share);
        lot->allocated_tax = std::max(0.0, lot->allocated_tax - it->tax_allocated * share);
        lot->original_quantity = lot->count;
    } else {
        lot->count += quantity;
    }
    cost_model.Recompute(lot);

    if (quantity == it->quantity) {
        entries_.erase(it);
    } else {
        const auto old_quantity = it->quantity;
        const auto new_quantity = old_quantity - quantity;
        it->quantity = new_quantity;
        if (it->kind == LedgerEntryKind::kResupply) {
            const double ratio =
                static_cast<double>(new_quantity) / static_cast<double>(old_quantity);
            it->total_price *= ratio;
            it->shipping_allocated *= ratio;
            it->tax_allocated *= ratio;
            it->total_cost *= ratio;
        } else {
            it->total_cost = it->unit_price * static_cast<double>(new_quantity);
        }
    }

    result.entries_reversed = 1;
    result.quantity_reversed = quantity;
    return result;
}

std::vector<LedgerEntry>::iterator TransactionLedger::FindEntryIt(const std::string& entry_id) {
    return std::find_if(entries_.begin(), entries_.end(), [&entry_id](const auto& entry) {
        return entry.entry_id == entry_id;
    });
}

}  // namespace humidor
