#ifndef SMARTPARK_TYPES_HPP
#define SMARTPARK_TYPES_HPP

#include <chrono>
#include <string>
#include <vector>

namespace smartpark {

using TimePoint = std::chrono::system_clock::time_point;

// Vehicle / slot classes. VIP is a slot pool, never a requestable vehicle type.
enum class Category { BIKE = 0, CAR = 1, EV = 2, HEAVY = 3, VIP = 4 };

// Helper to convert enum to printable string
const char* categoryToStr(Category c);

// Single-letter prefix used in slot ids (B, C, E, H, V)
char categoryPrefix(Category c);

// parseCategory: case-insensitive, surrounding whitespace ignored.
// Returns false (and leaves out untouched) for unknown text.
bool parseCategory(const std::string& text, Category& out);

// BIKE, CAR, EV and HEAVY may be requested at the gate; VIP may not.
bool isRequestable(Category c);

// All categories in slot construction order: VIP pool first, then standard pools.
const std::vector<Category>& constructionOrder();

/* ------------------ ParkError ------------------
   Every expected outcome the core reports back to its caller.
   AlreadyOccupied / NotOccupied / SlotNotFound are registry invariants
   and only surface on an orchestration bug.
*/
enum class ParkError {
    None = 0,
    InvalidVehicleType,
    InvalidVehicleId,
    DuplicateVehicle,
    LotFull,            // no slot available under the allocation policy
    VehicleNotFound,
    InvalidTimeRange,
    InvalidPricing,
    AlreadyOccupied,
    NotOccupied,
    SlotNotFound
};

const char* errorToStr(ParkError e);

} // namespace smartpark

#endif
