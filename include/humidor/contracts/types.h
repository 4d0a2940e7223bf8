#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace humidor {

using EpochNanos = std::int64_t;

inline EpochNanos NowEpochNanos();

enum class LedgerEntryKind {
    kSale,
    kResupply,
};

enum class TransactionState {
    kUnknown,
    kRecorded,
    kPartiallyReversed,
    kFullyReversed,
};

enum class EngineErrorKind {
    kInvalidNumericInput,
    kInsufficientStock,
    kDuplicateLotConflict,
    kReversalNotFound,
    kLotNotFound,
    kPersistenceFailure,
};

struct LotIdentity {
    std::string brand;
    std::string name;
    std::string size;
};

struct LotMergeRecord {
    std::int32_t count{0};
    double price{0.0};
    double shipping{0.0};
    double tax{0.0};
    double unit_cost{0.0};
    EpochNanos ts_ns{0};
};

struct Lot {
    std::string lot_id;
    std::string brand;
    std::string name;
    std::string size;
    std::string type;
    std::int32_t count{0};
    // Totals for the whole lot, never per unit.
    double price{0.0};
    double allocated_shipping{0.0};
    double allocated_tax{0.0};
    double unit_cost{0.0};
    std::optional<std::int32_t> original_quantity;
    std::optional<int> rating;
    std::vector<LotMergeRecord> history;

    double shipping() const { return allocated_shipping + allocated_tax; }
    LotIdentity identity() const { return LotIdentity{brand, name, size}; }
};

struct LedgerEntry {
    std::string entry_id;
    std::string transaction_id;
    EpochNanos ts_ns{0};
    LedgerEntryKind kind{LedgerEntryKind::kSale};
    std::string lot_id;
    std::string brand;
    std::string name;
    std::string size;
    double unit_price{0.0};
    std::int32_t quantity{0};
    double total_cost{0.0};
    // Resupply lines only.
    double total_price{0.0};
    double shipping_allocated{0.0};
    double tax_allocated{0.0};

    double shipping_tax_allocated() const { return shipping_allocated + tax_allocated; }
};

struct TransactionRecord {
    std::string transaction_id;
    LedgerEntryKind kind{LedgerEntryKind::kSale};
    std::int32_t recorded_quantity{0};
    EpochNanos ts_ns{0};
};

struct SaleItem {
    std::string lot_id;
    std::int32_t quantity{0};
};

struct ResupplyItem {
    std::string brand;
    std::string name;
    std::string size;
    std::string type;
    std::int32_t count{0};
    double price{0.0};
};

struct ResupplyOrder {
    std::vector<ResupplyItem> items;
    double total_shipping{0.0};
    double tax_rate_percent{0.0};
};

struct EngineIssue {
    EngineErrorKind kind{EngineErrorKind::kInvalidNumericInput};
    std::string lot_id;
    std::string transaction_id;
    std::string entry_id;
    std::string message;
};

inline const char* ToString(EngineErrorKind kind) {
    switch (kind) {
        case EngineErrorKind::kInvalidNumericInput:
            return "invalid_numeric_input";
        case EngineErrorKind::kInsufficientStock:
            return "insufficient_stock";
        case EngineErrorKind::kDuplicateLotConflict:
            return "duplicate_lot_conflict";
        case EngineErrorKind::kReversalNotFound:
            return "reversal_not_found";
        case EngineErrorKind::kLotNotFound:
            return "lot_not_found";
        case EngineErrorKind::kPersistenceFailure:
            return "persistence_failure";
    }
    return "unknown";
}

inline const char* ToString(LedgerEntryKind kind) {
    return kind == LedgerEntryKind::kResupply ? "resupply" : "sale";
}

inline const char* ToString(TransactionState state) {
    switch (state) {
        case TransactionState::kRecorded:
            return "recorded";
        case TransactionState::kPartiallyReversed:
            return "partially_reversed";
        case TransactionState::kFullyReversed:
            return "fully_reversed";
        case TransactionState::kUnknown:
            break;
    }
    return "unknown";
}

inline EngineIssue MakeIssue(EngineErrorKind kind,
                             std::string message,
                             std::string lot_id = "",
                             std::string transaction_id = "",
                             std::string entry_id = "") {
    EngineIssue issue;
    issue.kind = kind;
    issue.message = std::move(message);
    issue.lot_id = std::move(lot_id);
    issue.transaction_id = std::move(transaction_id);
    issue.entry_id = std::move(entry_id);
    return issue;
}

}  // namespace humidor

#include <chrono>

namespace humidor {

inline EpochNanos NowEpochNanos() {
    const auto now = std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
    return now.time_since_epoch().count();
}

}  // namespace humidor
