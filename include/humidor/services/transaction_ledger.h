#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/services/cost_model.h"
#include "humidor/services/lot_store.h"

namespace humidor {

struct SaleResult {
    std::string transaction_id;
    std::vector<LedgerEntry> entries;
    std::vector<EngineIssue> issues;
    bool persisted{true};
    std::string persist_error;
};

struct ResupplyResult {
    std::string order_id;
    std::vector<LedgerEntry> entries;
    std::vector<std::string> lot_ids;
    std::vector<EngineIssue> issues;
    bool persisted{true};
    std::string persist_error;
};

struct ReversalResult {
    std::size_t entries_reversed{0};
    std::int32_t quantity_reversed{0};
    std::vector<EngineIssue> issues;
    bool persisted{true};
    std::string persist_error;

    bool ok() const { return issues.empty(); }
};

// Append-only record of sales and resupplies grouped by transaction id.
// Reversal mutates the lot store and then shrinks or removes the entries;
// an entry that reaches zero quantity is dropped.
class TransactionLedger {
public:
    using Clock = std::function<EpochNanos()>;

    explicit TransactionLedger(Clock clock = nullptr);

    SaleResult RecordSale(const std::vector<SaleItem>& items,
                          LotStore* lots,
                          const CostModel& cost_model);
    // cost_model must already carry the order's tax rate.
    ResupplyResult RecordResupply(const ResupplyOrder& order,
                                  LotStore* lots,
                                  const CostModel& cost_model);

    ReversalResult ReverseEntry(const std::string& entry_id,
                                std::int32_t quantity,
                                LotStore* lots,
                                const CostModel& cost_model);
    ReversalResult ReverseSaleEntry(const std::string& entry_id,
                                    std::int32_t quantity,
                                    LotStore* lots,
                                    const CostModel& cost_model);
    ReversalResult ReverseResupplyEntry(const std::string& entry_id,
                                        std::int32_t quantity,
                                        LotStore* lots,
                                        const CostModel& cost_model);
    ReversalResult ReverseTransaction(const std::string& transaction_id,
                                      LotStore* lots,
                                      const CostModel& cost_model);

    TransactionState GetTransactionState(const std::string& transaction_id) const;

    const LedgerEntry* FindEntry(const std::string& entry_id) const;
    std::vector<LedgerEntry> EntriesFor(const std::string& transaction_id) const;
    std::vector<LedgerEntry> SalesHistory() const;
    const std::vector<LedgerEntry>& entries() const;
    std::vector<TransactionRecord> transactions() const;

    // Points entries of a lot that was folded into another at the survivor.
    std::size_t RelinkLot(const std::string& from_lot_id, const std::string& to_lot_id);

    // Loads persisted state. Transactions missing from `transactions` are
    // registered from their surviving entries.
    void Replace(std::vector<LedgerEntry> entries, std::vector<TransactionRecord> transactions);

private:
    EpochNanos Now() const;
    std::string NextTransactionId(LedgerEntryKind kind, EpochNanos ts_ns);
    static std::string BuildEntryId(const std::string& transaction_id, std::size_t index);
    ReversalResult ReverseEntryChecked(const std::string& entry_id,
                                       std::int32_t quantity,
                                       const LedgerEntryKind* expected_kind,
                                       LotStore* lots,
                                       const CostModel& cost_model);
    std::vector<LedgerEntry>::iterator FindEntryIt(const std::string& entry_id);

    Clock clock_;
    std::vector<LedgerEntry> entries_;
    std::map<std::string, TransactionRecord> transactions_;
    std::uint64_t next_sequence_{1};
};

}  // namespace humidor
