#include "humidor/core/inventory_codec.h"

#include <cmath>
#include <limits>
#include <utility>

#include "humidor/common/timestamp.h"
#include "humidor/core/numeric_input.h"
#include "humidor/services/lot_store.h"

namespace humidor {
namespace {

void SetError(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

// Older files occasionally hold numbers as text; both forms are accepted.
bool ReadDecimal(const json::Value& object,
                 const std::string& key,
                 double fallback,
                 double* out,
                 std::string* error) {
    const auto* field = object.Find(key);
    if (field == nullptr || field->IsNull()) {
        *out = fallback;
        return true;
    }
    if (field->IsNumber()) {
        *out = field->number_value;
        return true;
    }
    if (field->IsString() && ParseDecimalText(field->string_value, out, nullptr)) {
        return true;
    }
    SetError(error, "field '" + key + "' is not a number");
    return false;
}

bool ReadCount(const json::Value& object,
               const std::string& key,
               std::int32_t fallback,
               std::int32_t* out,
               std::string* error) {
    double value = 0.0;
    if (!ReadDecimal(object, key, static_cast<double>(fallback), &value, error)) {
        return false;
    }
    const double rounded = std::round(value);
    if (rounded > static_cast<double>(std::numeric_limits<std::int32_t>::max()) ||
        rounded < static_cast<double>(std::numeric_limits<std::int32_t>::min())) {
        SetError(error, "field '" + key + "' is out of range");
        return false;
    }
    *out = static_cast<std::int32_t>(rounded);
    return true;
}

std::string ReadText(const json::Value& object, const std::string& key) {
    const auto* field = object.Find(key);
    if (field == nullptr) {
        return "";
    }
    if (field->IsString()) {
        return field->string_value;
    }
    if (field->IsNumber()) {
        return json::Dump(*field);
    }
    return "";
}

EpochNanos ReadDate(const json::Value& object, const std::string& key) {
    Timestamp parsed;
    return Timestamp::TryFromText(json::GetString(object, key), &parsed) ? parsed.ToEpochNanos()
                                                                         : 0;
}

json::Value EncodeMergeRecord(const LotMergeRecord& record) {
    json::Value out = json::Value::Object();
    out.Set("count", json::Value::Number(record.count));
    out.Set("price", json::Value::Number(record.price));
    out.Set("shipping", json::Value::Number(record.shipping));
    out.Set("tax", json::Value::Number(record.tax));
    out.Set("price_per_stick", json::Value::Number(record.unit_cost));
    out.Set("date", json::Value::String(Timestamp(record.ts_ns).ToText()));
    return out;
}

bool DecodeMergeRecord(const json::Value& value, LotMergeRecord* record, std::string* error) {
    if (!value.IsObject()) {
        SetError(error, "history record is not an object");
        return false;
    }
    LotMergeRecord decoded;
    if (!ReadCount(value, "count", 0, &decoded.count, error) ||
        !ReadDecimal(value, "price", 0.0, &decoded.price, error) ||
        !ReadDecimal(value, "shipping", 0.0, &decoded.shipping, error) ||
        !ReadDecimal(value, "tax", 0.0, &decoded.tax, error) ||
        !ReadDecimal(value, "price_per_stick", 0.0, &decoded.unit_cost, error)) {
        return false;
    }
    decoded.ts_ns = ReadDate(value, "date");
    *record = decoded;
    return true;
}

bool DecodeKind(const std::string& text, LedgerEntryKind* kind) {
    if (text.empty() || text == "sale") {
        *kind = LedgerEntryKind::kSale;
        return true;
    }
    if (text == "resupply") {
        *kind = LedgerEntryKind::kResupply;
        return true;
    }
    return false;
}

}  // namespace

json::Value InventoryCodec::EncodeLot(const Lot& lot) {
    json::Value out = json::Value::Object();
    out.Set("lot_id", json::Value::String(lot.lot_id));
    out.Set("brand", json::Value::String(lot.brand));
    out.Set("cigar", json::Value::String(lot.name));
    out.Set("size", json::Value::String(lot.size));
    out.Set("type", json::Value::String(lot.type));
    out.Set("count", json::Value::Number(lot.count));
    out.Set("price", json::Value::Number(lot.price));
    out.Set("shipping", json::Value::Number(lot.shipping()));
    out.Set("allocated_shipping", json::Value::Number(lot.allocated_shipping));
    out.Set("allocated_tax", json::Value::Number(lot.allocated_tax));
    out.Set("price_per_stick", json::Value::Number(lot.unit_cost));
    if (lot.original_quantity.has_value()) {
        out.Set("original_quantity", json::Value::Number(*lot.original_quantity));
    }
    out.Set("personal_rating",
            lot.rating.has_value() ? json::Value::Number(*lot.rating) : json::Value::Null());
    if (!lot.history.empty()) {
        json::Value history = json::Value::Array();
        for (const auto& record : lot.history) {
            history.Append(EncodeMergeRecord(record));
        }
        out.Set("history", std::move(history));
    }
    return out;
}

bool InventoryCodec::DecodeLot(const json::Value& value, Lot* lot, std::string* error) {
    if (lot == nullptr) {
        SetError(error, "lot output is null");
        return false;
    }
    if (!value.IsObject()) {
        SetError(error, "lot record is not an object");
        return false;
    }

    Lot decoded;
    decoded.lot_id = json::GetString(value, "lot_id");
    decoded.brand = ReadText(value, "brand");
    decoded.name = value.Find("cigar") != nullptr ? ReadText(value, "cigar") : ReadText(value, "name");
    decoded.size = ReadText(value, "size");
    decoded.type = ReadText(value, "type");

    double combined_shipping = 0.0;
    if (!ReadCount(value, "count", 0, &decoded.count, error) ||
        !ReadDecimal(value, "price", 0.0, &decoded.price, error) ||
        !ReadDecimal(value, "shipping", 0.0, &combined_shipping, error) ||
        !ReadDecimal(value, "price_per_stick", 0.0, &decoded.unit_cost, error)) {
        return false;
    }
    if (decoded.count < 0) {
        decoded.count = 0;
    }

    // Without the split fields the whole legacy shipping value is treated as
    // shipping with no separate tax.
    if (value.Find("allocated_shipping") != nullptr || value.Find("allocated_tax") != nullptr) {
        if (!ReadDecimal(value, "allocated_shipping", 0.0, &decoded.allocated_shipping, error) ||
            !ReadDecimal(value, "allocated_tax", 0.0, &decoded.allocated_tax, error)) {
            return false;
        }
    } else {
        decoded.allocated_shipping = combined_shipping;
    }

    if (const auto* original = value.Find("original_quantity");
        original != nullptr && !original->IsNull()) {
        std::int32_t quantity = 0;
        if (!ReadCount(value, "original_quantity", 0, &quantity, error)) {
            return false;
        }
        if (quantity > 0) {
            decoded.original_quantity = quantity;
        }
    }

    if (const auto* rating = value.Find("personal_rating"); rating != nullptr && !rating->IsNull()) {
        std::int32_t parsed = 0;
        if (ReadCount(value, "personal_rating", 0, &parsed, nullptr) && parsed >= 1 &&
            parsed <= 10) {
            decoded.rating = parsed;
        }
    }

    if (const auto* history = value.Find("history"); history != nullptr && history->IsArray()) {
        for (const auto& item : history->array_value) {
            LotMergeRecord record;
            if (!DecodeMergeRecord(item, &record, error)) {
                return false;
            }
            decoded.history.push_back(record);
        }
    }

    *lot = std::move(decoded);
    return true;
}

json::Value InventoryCodec::EncodeEntry(const LedgerEntry& entry) {
    json::Value out = json::Value::Object();
    out.Set("entry_id", json::Value::String(entry.entry_id));
    out.Set("transaction_id", json::Value::String(entry.transaction_id));
    out.Set("date", json::Value::String(Timestamp(entry.ts_ns).ToText()));
    out.Set("kind", json::Value::String(ToString(entry.kind)));
    out.Set("lot_id", json::Value::String(entry.lot_id));
    out.Set("brand", json::Value::String(entry.brand));
    out.Set("cigar", json::Value::String(entry.name));
    out.Set("size", json::Value::String(entry.size));
    out.Set("price_per_stick", json::Value::Number(entry.unit_price));
    out.Set("quantity", json::Value::Number(entry.quantity));
    out.Set("total_cost", json::Value::Number(entry.total_cost));
    if (entry.kind == LedgerEntryKind::kResupply) {
        out.Set("price", json::Value::Number(entry.total_price));
        out.Set("shipping_allocated", json::Value::Number(entry.shipping_allocated));
        out.Set("tax_allocated", json::Value::Number(entry.tax_allocated));
        out.Set("shipping_tax_allocated", json::Value::Number(entry.shipping_tax_allocated()));
    }
    return out;
}

bool InventoryCodec::DecodeEntry(const json::Value& value,
                                 LedgerEntry* entry,
                                 std::string* error) {
    if (entry == nullptr) {
        SetError(error, "entry output is null");
        return false;
    }
    if (!value.IsObject()) {
        SetError(error, "ledger record is not an object");
        return false;
    }

    LedgerEntry decoded;
    const auto kind_text = json::GetString(value, "kind");
    if (!DecodeKind(kind_text, &decoded.kind)) {
        SetError(error, "unknown ledger entry kind: " + kind_text);
        return false;
    }
    decoded.entry_id = json::GetString(value, "entry_id");
    decoded.transaction_id = json::GetString(value, "transaction_id");
    decoded.ts_ns = ReadDate(value, "date");
    decoded.lot_id = json::GetString(value, "lot_id");
    decoded.brand = ReadText(value, "brand");
    decoded.name = value.Find("cigar") != nullptr ? ReadText(value, "cigar") : ReadText(value, "name");
    decoded.size = ReadText(value, "size");

    if (!ReadDecimal(value, "price_per_stick", 0.0, &decoded.unit_price, error) ||
        !ReadCount(value, "quantity", 1, &decoded.quantity, error)) {
        return false;
    }
    if (decoded.quantity < 1) {
        SetError(error, "ledger record has non-positive quantity");
        return false;
    }
    // Records written before quantities existed carry the single-stick price
    // as their total.
    if (!ReadDecimal(value, "total_cost", decoded.unit_price, &decoded.total_cost, error)) {
        return false;
    }

    if (decoded.kind == LedgerEntryKind::kResupply) {
        if (!ReadDecimal(value, "price", 0.0, &decoded.total_price, error) ||
            !ReadDecimal(value, "tax_allocated", 0.0, &decoded.tax_allocated, error)) {
            return false;
        }
        if (value.Find("shipping_allocated") != nullptr) {
            if (!ReadDecimal(value, "shipping_allocated", 0.0, &decoded.shipping_allocated, error)) {
                return false;
            }
        } else {
            double combined = 0.0;
            if (!ReadDecimal(value, "shipping_tax_allocated", 0.0, &combined, error)) {
                return false;
            }
            decoded.shipping_allocated = combined - decoded.tax_allocated;
        }
    }

    *entry = std::move(decoded);
    return true;
}

json::Value InventoryCodec::EncodeTransaction(const TransactionRecord& record) {
    json::Value out = json::Value::Object();
    out.Set("transaction_id", json::Value::String(record.transaction_id));
    out.Set("kind", json::Value::String(ToString(record.kind)));
    out.Set("recorded_quantity", json::Value::Number(record.recorded_quantity));
    out.Set("date", json::Value::String(Timestamp(record.ts_ns).ToText()));
    return out;
}

bool InventoryCodec::DecodeTransaction(const json::Value& value,
                                       TransactionRecord* record,
                                       std::string* error) {
    if (record == nullptr) {
        SetError(error, "transaction output is null");
        return false;
    }
    if (!value.IsObject()) {
        SetError(error, "transaction record is not an object");
        return false;
    }
    TransactionRecord decoded;
    decoded.transaction_id = json::GetString(value, "transaction_id");
    if (decoded.transaction_id.empty()) {
        SetError(error, "transaction record has no id");
        return false;
    }
    const auto kind_text = json::GetString(value, "kind");
    if (!DecodeKind(kind_text, &decoded.kind)) {
        SetError(error, "unknown transaction kind: " + kind_text);
        return false;
    }
    if (!ReadCount(value, "recorded_quantity", 0, &decoded.recorded_quantity, error)) {
        return false;
    }
    decoded.ts_ns = ReadDate(value, "date");
    *record = std::move(decoded);
    return true;
}

json::Value InventoryCodec::EncodeInventory(const std::vector<Lot>& lots) {
    json::Value out = json::Value::Array();
    for (const auto& lot : lots) {
        out.Append(EncodeLot(lot));
    }
    return out;
}

bool InventoryCodec::DecodeInventory(const json::Value& value,
                                     std::vector<Lot>* lots,
                                     std::string* error) {
    if (lots == nullptr) {
        SetError(error, "lots output is null");
        return false;
    }
    if (!value.IsArray()) {
        SetError(error, "inventory document is not an array");
        return false;
    }
    std::vector<Lot> decoded;
    decoded.reserve(value.array_value.size());
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
        Lot lot;
        std::string lot_error;
        if (!DecodeLot(value.array_value[i], &lot, &lot_error)) {
            SetError(error, "inventory record " + std::to_string(i) + ": " + lot_error);
            return false;
        }
        decoded.push_back(std::move(lot));
    }
    *lots = std::move(decoded);
    return true;
}

json::Value InventoryCodec::EncodeLedger(const std::vector<LedgerEntry>& entries,
                                         const std::vector<TransactionRecord>& transactions) {
    json::Value entry_array = json::Value::Array();
    for (const auto& entry : entries) {
        entry_array.Append(EncodeEntry(entry));
    }
    json::Value transaction_array = json::Value::Array();
    for (const auto& record : transactions) {
        transaction_array.Append(EncodeTransaction(record));
    }
    json::Value out = json::Value::Object();
    out.Set("entries", std::move(entry_array));
    out.Set("transactions", std::move(transaction_array));
    return out;
}

bool InventoryCodec::DecodeLedger(const json::Value& value,
                                  std::vector<LedgerEntry>* entries,
                                  std::vector<TransactionRecord>* transactions,
                                  std::string* error) {
    if (entries == nullptr || transactions == nullptr) {
        SetError(error, "ledger output is null");
        return false;
    }

    const json::Value* entry_array = nullptr;
    const json::Value* transaction_array = nullptr;
    if (value.IsArray()) {
        entry_array = &value;
    } else if (value.IsObject()) {
        entry_array = value.Find("entries");
        transaction_array = value.Find("transactions");
        if (entry_array != nullptr && !entry_array->IsArray()) {
            SetError(error, "ledger 'entries' is not an array");
            return false;
        }
        if (transaction_array != nullptr && !transaction_array->IsArray()) {
            SetError(error, "ledger 'transactions' is not an array");
            return false;
        }
    } else {
        SetError(error, "ledger document is neither an object nor an array");
        return false;
    }

    std::vector<LedgerEntry> decoded_entries;
    if (entry_array != nullptr) {
        for (std::size_t i = 0; i < entry_array->array_value.size(); ++i) {
            LedgerEntry entry;
            std::string entry_error;
            if (!DecodeEntry(entry_array->array_value[i], &entry, &entry_error)) {
                SetError(error, "ledger record " + std::to_string(i) + ": " + entry_error);
                return false;
            }
            decoded_entries.push_back(std::move(entry));
        }
    }

    std::vector<TransactionRecord> decoded_transactions;
    if (transaction_array != nullptr) {
        for (std::size_t i = 0; i < transaction_array->array_value.size(); ++i) {
            TransactionRecord record;
            std::string record_error;
            if (!DecodeTransaction(transaction_array->array_value[i], &record, &record_error)) {
                SetError(error, "transaction record " + std::to_string(i) + ": " + record_error);
                return false;
            }
            decoded_transactions.push_back(std::move(record));
        }
    }

    *entries = std::move(decoded_entries);
    *transactions = std::move(decoded_transactions);
    return true;
}

json::Value InventoryCodec::EncodeCatalog(const CatalogSnapshot& catalog) {
    const auto encode_list = [](const std::vector<std::string>& values) {
        json::Value out = json::Value::Array();
        for (const auto& item : values) {
            out.Append(json::Value::String(item));
        }
        return out;
    };
    json::Value out = json::Value::Object();
    out.Set("brands", encode_list(catalog.brands));
    out.Set("sizes", encode_list(catalog.sizes));
    out.Set("types", encode_list(catalog.types));
    return out;
}

bool InventoryCodec::DecodeCatalog(const json::Value& value,
                                   CatalogSnapshot* catalog,
                                   std::string* error) {
    if (catalog == nullptr) {
        SetError(error, "catalog output is null");
        return false;
    }
    if (!value.IsObject()) {
        SetError(error, "catalog document is not an object");
        return false;
    }
    const auto decode_list = [&value, error](const std::string& key,
                                             std::vector<std::string>* out) {
        out->clear();
        const auto* list = value.Find(key);
        if (list == nullptr) {
            return true;
        }
        if (!list->IsArray()) {
            SetError(error, "catalog '" + key + "' is not an array");
            return false;
        }
        for (const auto& item : list->array_value) {
            if (item.IsString()) {
                out->push_back(item.string_value);
            }
        }
        return true;
    };

    CatalogSnapshot decoded;
    if (!decode_list("brands", &decoded.brands) || !decode_list("sizes", &decoded.sizes) ||
        !decode_list("types", &decoded.types)) {
        return false;
    }
    *catalog = std::move(decoded);
    return true;
}

std::size_t InventoryCodec::RelinkEntries(const std::vector<Lot>& lots,
                                          std::vector<LedgerEntry>* entries) {
    if (entries == nullptr) {
        return 0;
    }
    std::size_t linked = 0;
    for (auto& entry : *entries) {
        if (!entry.lot_id.empty()) {
            continue;
        }
        const LotIdentity identity{entry.brand, entry.name, entry.size};
        for (const auto& lot : lots) {
            if (IdentityMatches(lot.identity(), identity)) {
                entry.lot_id = lot.lot_id;
                ++linked;
                break;
            }
        }
    }
    return linked;
}

}  // namespace humidor
