#pragma once

#include <string>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/core/simple_json.h"
#include "humidor/services/catalog_book.h"

namespace humidor {

// Record layout of the persisted documents. Lots keep the field names older
// inventory files used ("cigar", "price_per_stick", "personal_rating") and
// write the combined "shipping" next to the split shipping/tax fields.
class InventoryCodec {
public:
    static json::Value EncodeLot(const Lot& lot);
    static bool DecodeLot(const json::Value& value, Lot* lot, std::string* error);

    static json::Value EncodeEntry(const LedgerEntry& entry);
    static bool DecodeEntry(const json::Value& value, LedgerEntry* entry, std::string* error);

    static json::Value EncodeTransaction(const TransactionRecord& record);
    static bool DecodeTransaction(const json::Value& value,
                                  TransactionRecord* record,
                                  std::string* error);

    static json::Value EncodeInventory(const std::vector<Lot>& lots);
    static bool DecodeInventory(const json::Value& value,
                                std::vector<Lot>* lots,
                                std::string* error);

    static json::Value EncodeLedger(const std::vector<LedgerEntry>& entries,
                                    const std::vector<TransactionRecord>& transactions);
    // Accepts the ledger object or a bare array of sale records.
    static bool DecodeLedger(const json::Value& value,
                             std::vector<LedgerEntry>* entries,
                             std::vector<TransactionRecord>* transactions,
                             std::string* error);

    static json::Value EncodeCatalog(const CatalogSnapshot& catalog);
    static bool DecodeCatalog(const json::Value& value,
                              CatalogSnapshot* catalog,
                              std::string* error);

    // Fills empty lot ids on entries by case-insensitive (brand, name, size)
    // match. Returns the number of entries linked.
    static std::size_t RelinkEntries(const std::vector<Lot>& lots,
                                     std::vector<LedgerEntry>* entries);
};

}  // namespace humidor
