#include <gtest/gtest.h>

#include <stdexcept>

#include "humidor/common/timestamp.h"

namespace humidor {

TEST(TimestampTest, ParsesLedgerDateAsUtc) {
    const auto ts = Timestamp::FromText("2024-03-01 12:30:05");
    EXPECT_EQ(ts.ToEpochNanos(), 1709296205LL * 1'000'000'000);
    EXPECT_EQ(ts.ToText(), "2024-03-01 12:30:05");
    EXPECT_EQ(ts.ToCompact(), "20240301123005");
}

TEST(TimestampTest, AcceptsBareDate) {
    Timestamp ts;
    ASSERT_TRUE(Timestamp::TryFromText("2024-03-01", &ts));
    EXPECT_EQ(ts.ToText(), "2024-03-01 00:00:00");
}

TEST(TimestampTest, RejectsMalformedText) {
    Timestamp ts;
    EXPECT_FALSE(Timestamp::TryFromText("yesterday", &ts));
    EXPECT_FALSE(Timestamp::TryFromText("", &ts));
    EXPECT_THROW(Timestamp::FromText("03/01/2024"), std::runtime_error);
}

TEST(TimestampTest, OrdersByEpoch) {
    EXPECT_TRUE(Timestamp(1) < Timestamp(2));
    EXPECT_EQ(Timestamp(5), Timestamp(5));
}

}  // namespace humidor
