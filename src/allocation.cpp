#include "smartpark/allocation.hpp"

using namespace std;

namespace smartpark {

const char* ruleToStr(AllocationRule r) {
    switch (r) {
        case AllocationRule::None:        return "NONE";
        case AllocationRule::VipPriority: return "VIP";
        case AllocationRule::ExactMatch:  return "EXACT";
        case AllocationRule::Spillover:   return "SPILLOVER";
    }
    return "UNKNOWN";
}

namespace {

// First empty slot whose category is a or b, in iteration order
const Slot* firstEmpty(const SlotRegistry& registry, Category a, Category b) {
    for (const auto& s : registry.slots()) {
        if (!s.occupied() && (s.category() == a || s.category() == b)) return &s;
    }
    return nullptr;
}

AllocationResult found(const Slot* s, AllocationRule rule) {
    AllocationResult res;
    res.slotID = s->id();
    res.rule = rule;
    return res;
}

} // namespace

AllocationResult allocateSlot(const SlotRegistry& registry, Category requested, bool isVip) {
    if (!isRequestable(requested)) {
        AllocationResult res;
        res.error = ParkError::InvalidVehicleType;
        return res;
    }

    if (isVip) {
        if (const Slot* s = firstEmpty(registry, Category::VIP, Category::VIP))
            return found(s, AllocationRule::VipPriority);
    }

    if (const Slot* s = firstEmpty(registry, requested, requested))
        return found(s, AllocationRule::ExactMatch);

    if (requested == Category::CAR || requested == Category::EV) {
        if (const Slot* s = firstEmpty(registry, Category::CAR, Category::VIP))
            return found(s, AllocationRule::Spillover);
    }

    AllocationResult res;
    res.error = ParkError::LotFull;
    return res;
}

} // namespace smartpark
