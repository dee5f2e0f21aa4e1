#include "smartpark/billing.hpp"

using namespace std;

namespace smartpark {

namespace {
const PricingTier kCarTier {2, 10.0, 5.0};
}

PricingTable defaultPricing() {
    return PricingTable {
        {Category::BIKE,  PricingTier{2, 5.0, 2.0}},
        {Category::CAR,   kCarTier},
        {Category::EV,    PricingTier{2, 12.0, 6.0}},
        {Category::HEAVY, PricingTier{1, 15.0, 8.0}},
        {Category::VIP,   PricingTier{3, 15.0, 4.0}}  // discounted hourly rate for loyalty customers
    };
}

bool isValidTier(const PricingTier& t) {
    return t.fixedHours >= 0 && t.fixedRate >= 0.0 && t.perHourRate >= 0.0;
}

PricingTier tierFor(const PricingTable& table, Category c) {
    auto it = table.find(c);
    if (it != table.end()) return it->second;
    it = table.find(Category::CAR);
    if (it != table.end()) return it->second;
    return kCarTier;
}

long long billedHoursFor(long long elapsedSeconds) {
    long long hours = (elapsedSeconds + 3599) / 3600;
    if (hours < 1) hours = 1;
    return hours;
}

FeeResult calculateFee(TimePoint entry, TimePoint exit, Category c, const PricingTable& table) {
    FeeResult res;
    if (exit < entry) {
        res.error = ParkError::InvalidTimeRange;
        return res;
    }

    long long seconds = chrono::duration_cast<chrono::seconds>(exit - entry).count();
    res.billedHours = billedHoursFor(seconds);

    PricingTier tier = tierFor(table, c);
    if (res.billedHours <= tier.fixedHours) {
        res.fee = tier.fixedRate;
    } else {
        res.fee = tier.fixedRate + (res.billedHours - tier.fixedHours) * tier.perHourRate;
    }
    return res;
}

} // namespace smartpark
