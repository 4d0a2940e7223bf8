#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "humidor/services/catalog_book.h"

namespace humidor {

TEST(CatalogBookTest, AddTrimsAndRejectsBlankOrRepeatedValues) {
    CatalogBook catalog;
    EXPECT_TRUE(catalog.Add(CatalogKind::kBrand, "  Padron "));
    EXPECT_FALSE(catalog.Add(CatalogKind::kBrand, "Padron"));
    EXPECT_FALSE(catalog.Add(CatalogKind::kBrand, "   "));
    EXPECT_TRUE(catalog.Contains(CatalogKind::kBrand, "Padron"));
    EXPECT_FALSE(catalog.Contains(CatalogKind::kSize, "Padron"));
}

TEST(CatalogBookTest, ValuesAreSortedPerKind) {
    CatalogBook catalog;
    catalog.Add(CatalogKind::kSize, "6x52");
    catalog.Add(CatalogKind::kSize, "5x50");
    EXPECT_EQ(catalog.Values(CatalogKind::kSize), (std::vector<std::string>{"5x50", "6x52"}));
    EXPECT_TRUE(catalog.Values(CatalogKind::kType).empty());

    EXPECT_TRUE(catalog.Remove(CatalogKind::kSize, "6x52"));
    EXPECT_FALSE(catalog.Remove(CatalogKind::kSize, "6x52"));
}

TEST(CatalogBookTest, LearnsFromLotAndRoundTripsSnapshot) {
    Lot lot;
    lot.brand = "Oliva";
    lot.size = "6x50";
    lot.type = "Toro";
    CatalogBook catalog;
    catalog.Learn(lot);

    const auto snapshot = catalog.Snapshot();
    EXPECT_EQ(snapshot.brands, std::vector<std::string>{"Oliva"});
    EXPECT_EQ(snapshot.types, std::vector<std::string>{"Toro"});

    CatalogBook restored;
    restored.Add(CatalogKind::kBrand, "Stale");
    restored.Replace(snapshot);
    EXPECT_FALSE(restored.Contains(CatalogKind::kBrand, "Stale"));
    EXPECT_TRUE(restored.Contains(CatalogKind::kSize, "6x50"));
}

TEST(CatalogBookTest, KindNames) {
    EXPECT_STREQ(ToString(CatalogKind::kBrand), "brand");
    EXPECT_STREQ(ToString(CatalogKind::kType), "type");
}

}  // namespace humidor
