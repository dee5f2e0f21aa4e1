#ifndef SMARTPARK_BILLING_HPP
#define SMARTPARK_BILLING_HPP

#include <map>

#include "smartpark/types.hpp"

namespace smartpark {

/* ------------------ PricingTier ------------------
   fixedRate covers the first fixedHours billed hours; every billed
   hour beyond that adds perHourRate.
*/
struct PricingTier {
    long long fixedHours;
    double fixedRate;
    double perHourRate;
};

using PricingTable = std::map<Category, PricingTier>;

// Built-in tariff (see LotConfig::defaults)
PricingTable defaultPricing();

// Non-negative hours and rates
bool isValidTier(const PricingTier& t);

// Tier for c, falling back to CAR's tier and then to the built-in CAR tier
PricingTier tierFor(const PricingTable& table, Category c);

struct FeeResult {
    ParkError error = ParkError::None;
    double fee = 0.0;
    long long billedHours = 0;

    bool ok() const { return error == ParkError::None; }
};

// Whole hours billed for a stay of elapsedSeconds: rounded up, minimum 1
long long billedHoursFor(long long elapsedSeconds);

// Fee for a stay; exit before entry gives InvalidTimeRange
FeeResult calculateFee(TimePoint entry, TimePoint exit, Category c, const PricingTable& table);

} // namespace smartpark

#endif
