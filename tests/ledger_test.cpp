#include <gtest/gtest.h>

#include "smartpark/ledger.hpp"

using namespace smartpark;

namespace {

LedgerEntry visit(const std::string& vid, Category c, long long hours, double fee) {
    return LedgerEntry{vid, c, "X-01", TimePoint(), TimePoint() + std::chrono::hours(hours), hours, fee};
}

} // namespace

TEST(LedgerTest, EmptyAggregateIsZero) {
    Ledger ledger;
    Aggregate agg = ledger.aggregate();
    EXPECT_EQ(agg.count, 0u);
    EXPECT_DOUBLE_EQ(agg.totalFee, 0.0);
    EXPECT_DOUBLE_EQ(agg.averageDurationHours, 0.0);
}

TEST(LedgerTest, AggregatesCountSumAndAverage) {
    Ledger ledger;
    ledger.append(visit("A", Category::CAR, 1, 10.0));
    ledger.append(visit("B", Category::BIKE, 4, 9.0));
    ledger.append(visit("C", Category::CAR, 4, 20.0));

    Aggregate agg = ledger.aggregate();
    EXPECT_EQ(agg.count, 3u);
    EXPECT_DOUBLE_EQ(agg.totalFee, 39.0);
    EXPECT_DOUBLE_EQ(agg.averageDurationHours, 3.0);

    Aggregate cars = ledger.aggregateBy(Category::CAR);
    EXPECT_EQ(cars.count, 2u);
    EXPECT_DOUBLE_EQ(cars.totalFee, 30.0);
    EXPECT_DOUBLE_EQ(cars.averageDurationHours, 2.5);

    EXPECT_EQ(ledger.aggregateBy(Category::HEAVY).count, 0u);
}

TEST(LedgerTest, KeepsAppendOrder) {
    Ledger ledger;
    ledger.append(visit("FIRST", Category::EV, 1, 12.0));
    ledger.append(visit("SECOND", Category::EV, 1, 12.0));
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger.entries()[0].vehicleID, "FIRST");
    EXPECT_EQ(ledger.entries()[1].vehicleID, "SECOND");
}
