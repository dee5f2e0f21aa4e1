#ifndef SMARTPARK_PARKING_LOT_HPP
#define SMARTPARK_PARKING_LOT_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "smartpark/allocation.hpp"
#include "smartpark/billing.hpp"
#include "smartpark/ledger.hpp"
#include "smartpark/slot_registry.hpp"

namespace smartpark {

/* ------------------ LotConfig ------------------
   capacities : slots per category
   pricing    : tier per category
   shuffle    : permute slot iteration order at startup
   seed       : seed for that permutation
*/
struct LotConfig {
    std::map<Category, int> capacities;
    PricingTable pricing;
    bool shuffle = true;
    unsigned seed = 0;

    // 20 bikes, 30 cars, 10 EV, 5 heavy, 5 VIP with the default tariff
    static LotConfig defaults();
};

using ClockFn = std::function<TimePoint()>;

struct EntryResult {
    ParkError error = ParkError::None;
    std::string vehicleID;  // normalized
    std::string slotID;     // on DuplicateVehicle: where the vehicle already is
    Category slotCategory = Category::CAR;
    AllocationRule rule = AllocationRule::None;
    TimePoint entryTime;

    bool ok() const { return error == ParkError::None; }
};

// Exit receipt; fields other than error/vehicleID are set only on success
struct ExitResult {
    ParkError error = ParkError::None;
    std::string vehicleID;
    std::string slotID;
    Category category = Category::CAR;   // billing category
    TimePoint entryTime;
    TimePoint exitTime;
    long long billedHours = 0;
    double fee = 0.0;

    bool ok() const { return error == ParkError::None; }
};

struct RevenueReport {
    Aggregate total;
    std::vector<LedgerEntry> entries;
};

struct LotStats {
    size_t total = 0;
    size_t occupied = 0;
    size_t available = 0;
    double utilizationPercent = 0.0;
    std::map<Category, size_t> freeByCategory;
};

// Unsigned decimal seed; rejects empty text, signs and values beyond unsigned
bool parseSeed(const std::string& text, unsigned& seed);

// Trim and upper-case a vehicle number
std::string normalizeVehicleID(const std::string& raw);

/* ------------------ ParkingLot ------------------
   Session context owning the slot registry, the pricing table and
   the ledger. Entry and exit either commit fully or change nothing.
*/
class ParkingLot {
private:
    SlotRegistry registry_;
    Ledger ledger_;
    PricingTable pricing_;
    ClockFn clock_;

public:
    // Throws std::invalid_argument on a capacity outside [0, kMaxCapacity]
    explicit ParkingLot(const LotConfig& config, ClockFn clock = ClockFn());

    EntryResult vehicleEntry(const std::string& vehicleID, Category type, bool isVip);
    // Text type is parsed case-insensitively; unknown text is InvalidVehicleType
    EntryResult vehicleEntry(const std::string& vehicleID, const std::string& type, bool isVip);

    ExitResult vehicleExit(const std::string& vehicleID);

    std::vector<SlotView> currentSnapshot() const { return registry_.snapshot(); }
    RevenueReport revenueReport() const;
    LotStats stats() const;

    ParkError setPricing(Category c, const PricingTier& tier);
    const PricingTable& pricing() const { return pricing_; }

    const SlotRegistry& registry() const { return registry_; }
    const Ledger& ledger() const { return ledger_; }
};

} // namespace smartpark

#endif
