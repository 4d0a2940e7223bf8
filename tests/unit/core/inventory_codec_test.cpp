#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "humidor/core/inventory_codec.h"

namespace humidor {
namespace {

json::Value ParseOrDie(const std::string& text) {
    json::Value value;
    std::string error;
    EXPECT_TRUE(json::Parse(text, &value, &error)) << error;
    return value;
}

}  // namespace

TEST(InventoryCodecTest, LotRoundTripKeepsSplitShippingAndHistory) {
    Lot lot;
    lot.lot_id = "lot-000003";
    lot.brand = "Padron";
    lot.name = "1964";
    lot.size = "5x50";
    lot.type = "Robusto";
    lot.count = 7;
    lot.price = 50.0;
    lot.allocated_shipping = 10.0;
    lot.allocated_tax = 4.3;
    lot.unit_cost = 9.19;
    lot.original_quantity = 10;
    lot.rating = 8;
    LotMergeRecord record;
    record.count = 5;
    record.price = 30.0;
    record.ts_ns = 1709296205LL * 1'000'000'000;
    lot.history.push_back(record);

    const auto encoded = InventoryCodec::EncodeLot(lot);
    EXPECT_EQ(json::GetString(encoded, "cigar"), "1964");
    EXPECT_NEAR(json::GetNumber(encoded, "shipping"), 14.3, 1e-9);
    EXPECT_DOUBLE_EQ(json::GetNumber(encoded, "price_per_stick"), 9.19);

    Lot decoded;
    std::string error;
    ASSERT_TRUE(InventoryCodec::DecodeLot(encoded, &decoded, &error)) << error;
    EXPECT_EQ(decoded.lot_id, "lot-000003");
    EXPECT_EQ(decoded.name, "1964");
    EXPECT_EQ(decoded.count, 7);
    EXPECT_DOUBLE_EQ(decoded.allocated_shipping, 10.0);
    EXPECT_DOUBLE_EQ(decoded.allocated_tax, 4.3);
    EXPECT_EQ(decoded.original_quantity.value_or(0), 10);
    EXPECT_EQ(decoded.rating.value_or(0), 8);
    ASSERT_EQ(decoded.history.size(), 1U);
    EXPECT_EQ(decoded.history[0].count, 5);
    EXPECT_EQ(decoded.history[0].ts_ns, record.ts_ns);
}

TEST(InventoryCodecTest, LegacyLotIsUpgradedOnRead) {
    const auto value = ParseOrDie(
        R"({"brand":"Oliva","name":"Serie V","size":"6x50","count":"-3","price":"$40",)"
        R"("shipping":12.5,"price_per_stick":0,"personal_rating":14})");

    Lot lot;
    std::string error;
    ASSERT_TRUE(InventoryCodec::DecodeLot(value, &lot, &error)) << error;
    EXPECT_TRUE(lot.lot_id.empty());
    EXPECT_EQ(lot.name, "Serie V");
    EXPECT_EQ(lot.count, 0);
    EXPECT_DOUBLE_EQ(lot.price, 40.0);
    EXPECT_DOUBLE_EQ(lot.allocated_shipping, 12.5);
    EXPECT_DOUBLE_EQ(lot.allocated_tax, 0.0);
    EXPECT_FALSE(lot.original_quantity.has_value());
    EXPECT_FALSE(lot.rating.has_value());
}

TEST(InventoryCodecTest, RejectsNonNumericLotFields) {
    Lot lot;
    std::string error;
    EXPECT_FALSE(InventoryCodec::DecodeLot(ParseOrDie(R"({"price":"cheap"})"), &lot, &error));
    EXPECT_EQ(error, "field 'price' is not a number");
    EXPECT_FALSE(InventoryCodec::DecodeLot(ParseOrDie("[]"), &lot, &error));

    std::vector<Lot> lots;
    EXPECT_FALSE(InventoryCodec::DecodeInventory(
        ParseOrDie(R"([{"brand":"a"},{"count":true}])"), &lots, &error));
    EXPECT_EQ(error, "inventory record 1: field 'count' is not a number");
}

TEST(InventoryCodecTest, LegacySaleRecordDefaultsQuantityAndTotal) {
    const auto value = ParseOrDie(
        R"({"date":"2023-11-02 18:04:00","brand":"Padron","cigar":"1964","size":"5x50",)"
        R"("price_per_stick":6.86})");

    LedgerEntry entry;
    std::string error;
    ASSERT_TRUE(InventoryCodec::DecodeEntry(value, &entry, &error)) << error;
    EXPECT_EQ(entry.kind, LedgerEntryKind::kSale);
    EXPECT_EQ(entry.quantity, 1);
    EXPECT_DOUBLE_EQ(entry.total_cost, 6.86);
    EXPECT_TRUE(entry.transaction_id.empty());
    EXPECT_EQ(entry.ts_ns, 1698948240LL * 1'000'000'000);
}

TEST(InventoryCodecTest, EntryRejectsBadKindAndQuantity) {
    LedgerEntry entry;
    std::string error;
    EXPECT_FALSE(InventoryCodec::DecodeEntry(ParseOrDie(R"({"kind":"gift"})"), &entry, &error));
    EXPECT_EQ(error, "unknown ledger entry kind: gift");
    EXPECT_FALSE(InventoryCodec::DecodeEntry(ParseOrDie(R"({"quantity":0})"), &entry, &error));
    EXPECT_EQ(error, "ledger record has non-positive quantity");
}

TEST(InventoryCodecTest, ResupplyEntryCarriesAllocations) {
    LedgerEntry entry;
    entry.entry_id = "R-20240301123005-0001/1";
    entry.transaction_id = "R-20240301123005-0001";
    entry.kind = LedgerEntryKind::kResupply;
    entry.quantity = 10;
    entry.unit_price = 6.86;
    entry.total_cost = 68.6;
    entry.total_price = 50.0;
    entry.shipping_allocated = 10.0;
    entry.tax_allocated = 4.3;

    const auto encoded = InventoryCodec::EncodeEntry(entry);
    EXPECT_EQ(json::GetString(encoded, "kind"), "resupply");
    EXPECT_NEAR(json::GetNumber(encoded, "shipping_tax_allocated"), 14.3, 1e-9);

    LedgerEntry decoded;
    std::string error;
    ASSERT_TRUE(InventoryCodec::DecodeEntry(encoded, &decoded, &error)) << error;
    EXPECT_EQ(decoded.entry_id, entry.entry_id);
    EXPECT_DOUBLE_EQ(decoded.total_price, 50.0);
    EXPECT_DOUBLE_EQ(decoded.shipping_allocated, 10.0);

    // Older resupply records only stored the combined allocation.
    const auto legacy = ParseOrDie(
        R"({"kind":"resupply","quantity":10,"price":50,"tax_allocated":4.3,)"
        R"("shipping_tax_allocated":14.3})");
    ASSERT_TRUE(InventoryCodec::DecodeEntry(legacy, &decoded, &error)) << error;
    EXPECT_NEAR(decoded.shipping_allocated, 10.0, 1e-9);
}

TEST(InventoryCodecTest, LedgerAcceptsObjectOrBareArray) {
    std::vector<LedgerEntry> entries;
    std::vector<TransactionRecord> transactions;
    std::string error;

    ASSERT_TRUE(InventoryCodec::DecodeLedger(
        ParseOrDie(R"([{"cigar":"1964","price_per_stick":6.86},{"cigar":"V","quantity":2}])"),
        &entries,
        &transactions,
        &error))
        << error;
    EXPECT_EQ(entries.size(), 2U);
    EXPECT_TRUE(transactions.empty());

    TransactionRecord record;
    record.transaction_id = "S-20240301123005-0002";
    record.recorded_quantity = 3;
    const auto encoded = InventoryCodec::EncodeLedger(entries, {record});
    ASSERT_TRUE(InventoryCodec::DecodeLedger(encoded, &entries, &transactions, &error)) << error;
    ASSERT_EQ(transactions.size(), 1U);
    EXPECT_EQ(transactions[0].transaction_id, record.transaction_id);
    EXPECT_EQ(transactions[0].recorded_quantity, 3);

    EXPECT_FALSE(InventoryCodec::DecodeLedger(
        ParseOrDie(R"({"entries":{}})"), &entries, &transactions, &error));
    EXPECT_EQ(error, "ledger 'entries' is not an array");
    EXPECT_FALSE(
        InventoryCodec::DecodeLedger(ParseOrDie("12"), &entries, &transactions, &error));
}

TEST(InventoryCodecTest, CatalogKeepsOnlyStrings) {
    CatalogSnapshot catalog;
    std::string error;
    ASSERT_TRUE(InventoryCodec::DecodeCatalog(
        ParseOrDie(R"({"brands":["Padron",3,"Oliva"],"types":[]})"), &catalog, &error))
        << error;
    EXPECT_EQ(catalog.brands, (std::vector<std::string>{"Padron", "Oliva"}));
    EXPECT_TRUE(catalog.sizes.empty());

    const auto encoded = InventoryCodec::EncodeCatalog(catalog);
    EXPECT_EQ(json::Dump(encoded), R"({"brands":["Padron","Oliva"],"sizes":[],"types":[]})");
}

TEST(InventoryCodecTest, RelinkEntriesMatchesIdentityIgnoringCase) {
    Lot lot;
    lot.lot_id = "lot-000001";
    lot.brand = "Padron";
    lot.name = "1964";
    lot.size = "5x50";

    LedgerEntry orphan;
    orphan.brand = "PADRON";
    orphan.name = "1964";
    orphan.size = "5X50";
    LedgerEntry unmatched;
    unmatched.brand = "Oliva";
    LedgerEntry linked;
    linked.lot_id = "lot-000007";
    std::vector<LedgerEntry> entries{orphan, unmatched, linked};

    EXPECT_EQ(InventoryCodec::RelinkEntries({lot}, &entries), 1U);
    EXPECT_EQ(entries[0].lot_id, "lot-000001");
    EXPECT_TRUE(entries[1].lot_id.empty());
    EXPECT_EQ(entries[2].lot_id, "lot-000007");
}

}  // namespace humidor
