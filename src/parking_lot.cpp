#include "smartpark/parking_lot.hpp"

#include <cctype>
#include <iostream>
#include <limits>

using namespace std;

namespace smartpark {

LotConfig LotConfig::defaults() {
    LotConfig cfg;
    cfg.capacities = {
        {Category::BIKE, 20},
        {Category::CAR, 30},
        {Category::EV, 10},
        {Category::HEAVY, 5},
        {Category::VIP, 5}
    };
    cfg.pricing = defaultPricing();
    return cfg;
}

bool parseSeed(const string& text, unsigned& seed) {
    if (text.empty()) return false;
    unsigned long long v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > numeric_limits<unsigned>::max()) return false;
    }
    seed = static_cast<unsigned>(v);
    return true;
}

string normalizeVehicleID(const string& raw) {
    size_t b = 0, e = raw.size();
    while (b < e && isspace(static_cast<unsigned char>(raw[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(raw[e - 1]))) --e;
    string id = raw.substr(b, e - b);
    for (char &c : id) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    return id;
}

ParkingLot::ParkingLot(const LotConfig& config, ClockFn clock)
    : pricing_(config.pricing), clock_(clock) {
    if (!clock_) clock_ = [] { return chrono::system_clock::now(); };
    registry_.initialize(config.capacities, config.shuffle, config.seed);
}

EntryResult ParkingLot::vehicleEntry(const string& vehicleID, const string& type, bool isVip) {
    Category c;
    if (!parseCategory(type, c)) {
        EntryResult res;
        res.error = ParkError::InvalidVehicleType;
        res.vehicleID = normalizeVehicleID(vehicleID);
        return res;
    }
    return vehicleEntry(vehicleID, c, isVip);
}

EntryResult ParkingLot::vehicleEntry(const string& vehicleID, Category type, bool isVip) {
    EntryResult res;
    res.vehicleID = normalizeVehicleID(vehicleID);

    if (!isRequestable(type)) {
        res.error = ParkError::InvalidVehicleType;
        return res;
    }
    if (res.vehicleID.empty()) {
        res.error = ParkError::InvalidVehicleId;
        return res;
    }

    string existing;
    if (registry_.findByVehicle(res.vehicleID, existing)) {
        res.error = ParkError::DuplicateVehicle;
        res.slotID = existing;
        return res;
    }

    AllocationResult alloc = allocateSlot(registry_, type, isVip);
    if (!alloc.ok()) {
        res.error = alloc.error;
        return res;
    }

    res.entryTime = clock_();
    ParkError err = registry_.reserve(alloc.slotID, Reservation(res.vehicleID, type, res.entryTime, isVip));
    if (err != ParkError::None) {
        cerr << "⚠️ Internal inconsistency: reserve " << alloc.slotID << " failed with " << errorToStr(err) << "\n";
        res.error = err;
        return res;
    }

    res.slotID = alloc.slotID;
    res.slotCategory = registry_.find(alloc.slotID)->category();
    res.rule = alloc.rule;
    return res;
}

ExitResult ParkingLot::vehicleExit(const string& vehicleID) {
    ExitResult res;
    res.vehicleID = normalizeVehicleID(vehicleID);

    string slotID;
    if (res.vehicleID.empty() || !registry_.findByVehicle(res.vehicleID, slotID)) {
        res.error = ParkError::VehicleNotFound;
        return res;
    }

    const Reservation& r = registry_.find(slotID)->reservation();

    // Billed at the requested type even when parked in the VIP pool
    Category billing = r.requested;

    TimePoint exitTime = clock_();
    FeeResult fee = calculateFee(r.entryTime, exitTime, billing, pricing_);
    if (!fee.ok()) {
        res.error = fee.error;
        return res;
    }

    ReleaseResult rel = registry_.release(slotID);
    if (!rel.ok()) {
        cerr << "⚠️ Internal inconsistency: release " << slotID << " failed with " << errorToStr(rel.error) << "\n";
        res.error = rel.error;
        return res;
    }

    ledger_.append(LedgerEntry{res.vehicleID, billing, slotID, rel.reservation.entryTime, exitTime,
                               fee.billedHours, fee.fee});

    res.slotID = slotID;
    res.category = billing;
    res.entryTime = rel.reservation.entryTime;
    res.exitTime = exitTime;
    res.billedHours = fee.billedHours;
    res.fee = fee.fee;
    return res;
}

RevenueReport ParkingLot::revenueReport() const {
    RevenueReport rep;
    rep.total = ledger_.aggregate();
    rep.entries = ledger_.entries();
    return rep;
}

LotStats ParkingLot::stats() const {
    LotStats st;
    st.total = registry_.size();
    st.occupied = registry_.occupiedCount();
    st.available = st.total - st.occupied;
    st.utilizationPercent = st.total == 0 ? 0.0 : (100.0 * st.occupied / st.total);
    for (Category c : constructionOrder()) st.freeByCategory[c] = registry_.freeCount(c);
    return st;
}

ParkError ParkingLot::setPricing(Category c, const PricingTier& tier) {
    if (!isValidTier(tier)) return ParkError::InvalidPricing;
    pricing_[c] = tier;
    return ParkError::None;
}

} // namespace smartpark
