#include <gtest/gtest.h>

#include "smartpark/allocation.hpp"

using namespace smartpark;

namespace {

class AllocationTest : public ::testing::Test {
protected:
    SlotRegistry reg;

    void build(const std::map<Category, int>& caps) { reg.initialize(caps); }

    void fill(const std::string& slotID, const std::string& vid, Category type) {
        ASSERT_EQ(reg.reserve(slotID, Reservation(vid, type, TimePoint(), false)), ParkError::None);
    }
};

} // namespace

TEST_F(AllocationTest, VipTakesVipSlotEvenWhenStandardIsFree) {
    build({{Category::CAR, 2}, {Category::VIP, 1}});
    AllocationResult r = allocateSlot(reg, Category::CAR, true);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.slotID, "V-01");
    EXPECT_EQ(r.rule, AllocationRule::VipPriority);
}

TEST_F(AllocationTest, VipFallsBackToOwnTypeWhenVipPoolFull) {
    build({{Category::BIKE, 1}, {Category::VIP, 1}});
    fill("V-01", "VIP1", Category::CAR);
    AllocationResult r = allocateSlot(reg, Category::BIKE, true);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.slotID, "B-01");
    EXPECT_EQ(r.rule, AllocationRule::ExactMatch);
}

TEST_F(AllocationTest, StandardRequestPrefersExactCategory) {
    build({{Category::CAR, 1}, {Category::VIP, 1}});
    AllocationResult r = allocateSlot(reg, Category::CAR, false);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.slotID, "C-01");
}

TEST_F(AllocationTest, CarSpillsIntoVipWhenCarPoolFull) {
    build({{Category::CAR, 1}, {Category::VIP, 1}});
    fill("C-01", "AB1", Category::CAR);
    AllocationResult r = allocateSlot(reg, Category::CAR, false);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.slotID, "V-01");
    EXPECT_EQ(r.rule, AllocationRule::Spillover);
}

TEST_F(AllocationTest, EvSpillsIntoCarBeforeFailing) {
    build({{Category::CAR, 1}, {Category::EV, 1}});
    fill("E-01", "EV1", Category::EV);
    AllocationResult r = allocateSlot(reg, Category::EV, false);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.slotID, "C-01");
    EXPECT_EQ(r.rule, AllocationRule::Spillover);

    fill("C-01", "EV2", Category::EV);
    EXPECT_EQ(allocateSlot(reg, Category::EV, false).error, ParkError::LotFull);
}

TEST_F(AllocationTest, BikeAndHeavyNeverSpill) {
    build({{Category::BIKE, 1}, {Category::HEAVY, 1}, {Category::CAR, 3}, {Category::VIP, 3}});
    fill("B-01", "B1", Category::BIKE);
    fill("H-01", "H1", Category::HEAVY);
    EXPECT_EQ(allocateSlot(reg, Category::BIKE, false).error, ParkError::LotFull);
    EXPECT_EQ(allocateSlot(reg, Category::HEAVY, false).error, ParkError::LotFull);
}

TEST_F(AllocationTest, VipIsNotARequestableType) {
    build({{Category::VIP, 2}});
    AllocationResult r = allocateSlot(reg, Category::VIP, true);
    EXPECT_EQ(r.error, ParkError::InvalidVehicleType);
    EXPECT_TRUE(r.slotID.empty());
}

TEST_F(AllocationTest, FollowsRegistryIterationOrderNotIdOrder) {
    reg.initialize({{Category::CAR, 10}}, true, 1234);
    AllocationResult r = allocateSlot(reg, Category::CAR, false);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.slotID, reg.slots().front().id());
}

TEST_F(AllocationTest, DoesNotReserve) {
    build({{Category::CAR, 1}});
    ASSERT_TRUE(allocateSlot(reg, Category::CAR, false).ok());
    EXPECT_EQ(reg.occupiedCount(), 0u);
}

TEST(AllocationRuleTest, Names) {
    EXPECT_STREQ(ruleToStr(AllocationRule::VipPriority), "VIP");
    EXPECT_STREQ(ruleToStr(AllocationRule::Spillover), "SPILLOVER");
}
