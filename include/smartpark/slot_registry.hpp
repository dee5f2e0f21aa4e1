#ifndef SMARTPARK_SLOT_REGISTRY_HPP
#define SMARTPARK_SLOT_REGISTRY_HPP

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "smartpark/types.hpp"

namespace smartpark {

/* ------------------ Reservation ------------------
   Occupancy record, lives inside its slot while the slot is occupied.
   vehicleID   : normalized (trimmed, upper-case) vehicle number
   requested   : vehicle type asked for at the gate (never VIP)
   entryTime   : timestamp taken when the slot was reserved
   isVip       : loyalty flag given at entry
*/
class Reservation {
public:
    std::string vehicleID;
    Category requested = Category::CAR;
    TimePoint entryTime;
    bool isVip = false;

    Reservation() = default;
    Reservation(const std::string& vid, Category type, TimePoint entry, bool vip)
        : vehicleID(vid), requested(type), entryTime(entry), isVip(vip) {}
};

/* ------------------ Slot ------------------
   One parking slot. id and category are fixed at construction,
   only occupancy changes afterwards.
*/
class Slot {
private:
    std::string id_;
    Category category_;
    bool occupied_;
    Reservation reservation_; // valid only if occupied_
public:
    Slot(const std::string& id, Category c) : id_(id), category_(c), occupied_(false) {}

    const std::string& id() const { return id_; }
    Category category() const { return category_; }
    bool occupied() const { return occupied_; }

    void assign(const Reservation& r) {
        reservation_ = r;
        occupied_ = true;
    }
    Reservation release() {
        Reservation r = reservation_;
        occupied_ = false;
        reservation_ = Reservation{};
        return r;
    }
    const Reservation& reservation() const { return reservation_; }
};

// Read-only view of one slot, as returned by snapshot()
struct SlotView {
    std::string slotID;
    Category category;
    bool occupied;
    Reservation reservation; // meaningful only if occupied
};

// Outcome of SlotRegistry::release
struct ReleaseResult {
    ParkError error = ParkError::None;
    Reservation reservation;

    bool ok() const { return error == ParkError::None; }
};

// Largest per-category capacity initialize() accepts
const int kMaxCapacity = 999;

// Builds a slot id such as "C-07"
std::string makeSlotID(Category c, int seq);

/* ------------------ SlotRegistry ------------------
   Fixed set of slots in an explicit iteration order plus an
   id -> position index. Iteration order decides which of several
   equally good empty slots the allocator picks.
    - slots_ : vector<Slot> in iteration order
    - index_ : slot id -> position in slots_
*/
class SlotRegistry {
private:
    std::vector<Slot> slots_;
    std::unordered_map<std::string, size_t> index_;

public:
    SlotRegistry() = default;

    // Build the slot set: VIP pool first, then BIKE, CAR, EV, HEAVY.
    // When shuffle is set the iteration order is permuted with a
    // generator seeded from seed; ids and categories do not depend on it.
    // Throws std::invalid_argument on a capacity outside [0, kMaxCapacity].
    void initialize(const std::map<Category, int>& capacities, bool shuffle = false, unsigned seed = 0);

    // Linear scan. Returns false when no slot holds the vehicle.
    bool findByVehicle(const std::string& vehicleID, std::string& slotID) const;

    ParkError reserve(const std::string& slotID, const Reservation& r);
    ReleaseResult release(const std::string& slotID);

    // Sorted by slot id, no side effects
    std::vector<SlotView> snapshot() const;

    // Slots in iteration order, for the allocator
    const std::vector<Slot>& slots() const { return slots_; }
    const Slot* find(const std::string& slotID) const;

    size_t size() const { return slots_.size(); }
    size_t occupiedCount() const;
    size_t freeCount(Category c) const;
    size_t capacity(Category c) const;
};

} // namespace smartpark

#endif
