#ifndef SMARTPARK_ALLOCATION_HPP
#define SMARTPARK_ALLOCATION_HPP

#include <string>

#include "smartpark/slot_registry.hpp"

namespace smartpark {

// Which policy rule produced the slot
enum class AllocationRule { None = 0, VipPriority, ExactMatch, Spillover };

const char* ruleToStr(AllocationRule r);

struct AllocationResult {
    ParkError error = ParkError::None;
    std::string slotID;
    AllocationRule rule = AllocationRule::None;

    bool ok() const { return error == ParkError::None; }
};

/* allocateSlot: pick a slot without reserving it. First match wins:
    1. isVip            -> first empty VIP slot
    2. exact category   -> first empty slot of the requested type
    3. CAR / EV only    -> first empty CAR or VIP slot (spillover)
   "First" is registry iteration order. VIP as requested type gives
   InvalidVehicleType; nothing found gives LotFull.
*/
AllocationResult allocateSlot(const SlotRegistry& registry, Category requested, bool isVip);

} // namespace smartpark

#endif
