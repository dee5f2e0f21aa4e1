#include <gtest/gtest.h>

#include "smartpark/billing.hpp"

using namespace smartpark;
using std::chrono::seconds;

namespace {

const TimePoint kEntry = TimePoint() + std::chrono::hours(1000);

FeeResult feeAfter(long long secs, Category c, const PricingTable& table = defaultPricing()) {
    return calculateFee(kEntry, kEntry + seconds(secs), c, table);
}

} // namespace

TEST(BillingTest, BilledHoursRoundUpWithMinimumOfOne) {
    EXPECT_EQ(billedHoursFor(0), 1);
    EXPECT_EQ(billedHoursFor(1), 1);
    EXPECT_EQ(billedHoursFor(3600), 1);
    EXPECT_EQ(billedHoursFor(3601), 2);
    EXPECT_EQ(billedHoursFor(7200), 2);
}

TEST(BillingTest, ZeroDurationBillsOneHourAtFixedRateForEveryCategory) {
    PricingTable table = defaultPricing();
    for (const auto& kv : table) {
        FeeResult r = feeAfter(0, kv.first, table);
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(r.billedHours, 1);
        EXPECT_DOUBLE_EQ(r.fee, kv.second.fixedRate) << categoryToStr(kv.first);
    }
}

TEST(BillingTest, FixedHoursBoundary) {
    PricingTable table = defaultPricing();
    for (const auto& kv : table) {
        const PricingTier& t = kv.second;
        FeeResult atLimit = feeAfter(t.fixedHours * 3600, kv.first, table);
        FeeResult over = feeAfter(t.fixedHours * 3600 + 1, kv.first, table);
        EXPECT_DOUBLE_EQ(atLimit.fee, t.fixedRate) << categoryToStr(kv.first);
        EXPECT_DOUBLE_EQ(over.fee, t.fixedRate + t.perHourRate) << categoryToStr(kv.first);
    }
}

TEST(BillingTest, OverageAddsPerHourRate) {
    // CAR: 2h for 10, then 5/h; 5h10m bills 6h -> 10 + 4 * 5
    FeeResult r = feeAfter(5 * 3600 + 600, Category::CAR);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.billedHours, 6);
    EXPECT_DOUBLE_EQ(r.fee, 30.0);

    // HEAVY: 1h for 15, then 8/h; 3h bills 15 + 2 * 8
    EXPECT_DOUBLE_EQ(feeAfter(3 * 3600, Category::HEAVY).fee, 31.0);
}

TEST(BillingTest, FeeIsMonotonicInDuration) {
    for (Category c : constructionOrder()) {
        double prev = 0.0;
        for (long long secs = 0; secs <= 12 * 3600; secs += 900) {
            double fee = feeAfter(secs, c).fee;
            EXPECT_GE(fee, prev) << categoryToStr(c) << " at " << secs << "s";
            prev = fee;
        }
    }
}

TEST(BillingTest, ExitBeforeEntryIsInvalid) {
    FeeResult r = calculateFee(kEntry, kEntry - seconds(1), Category::CAR, defaultPricing());
    EXPECT_EQ(r.error, ParkError::InvalidTimeRange);
    EXPECT_FALSE(r.ok());
}

TEST(BillingTest, SubSecondRemainderIsTruncated) {
    TimePoint exit = kEntry + seconds(3600) + std::chrono::milliseconds(500);
    FeeResult r = calculateFee(kEntry, exit, Category::CAR, defaultPricing());
    EXPECT_EQ(r.billedHours, 1);
}

TEST(BillingTest, MissingCategoryFallsBackToCarTier) {
    PricingTable table = defaultPricing();
    table.erase(Category::HEAVY);
    EXPECT_DOUBLE_EQ(feeAfter(3 * 3600, Category::HEAVY, table).fee,
                     feeAfter(3 * 3600, Category::CAR, table).fee);

    PricingTable empty;
    FeeResult r = feeAfter(3 * 3600, Category::EV, empty);
    EXPECT_DOUBLE_EQ(r.fee, 15.0);
}

TEST(BillingTest, TierValidation) {
    EXPECT_TRUE(isValidTier(PricingTier{0, 0.0, 0.0}));
    EXPECT_FALSE(isValidTier(PricingTier{-1, 1.0, 1.0}));
    EXPECT_FALSE(isValidTier(PricingTier{1, -1.0, 1.0}));
    EXPECT_FALSE(isValidTier(PricingTier{1, 1.0, -0.5}));
}
