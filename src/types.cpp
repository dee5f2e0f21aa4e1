#include "smartpark/types.hpp"

#include <cctype>

using namespace std;

namespace smartpark {

const char* categoryToStr(Category c) {
    switch (c) {
        case Category::BIKE:  return "BIKE";
        case Category::CAR:   return "CAR";
        case Category::EV:    return "EV";
        case Category::HEAVY: return "HEAVY";
        case Category::VIP:   return "VIP";
    }
    return "UNKNOWN";
}

char categoryPrefix(Category c) {
    switch (c) {
        case Category::BIKE:  return 'B';
        case Category::CAR:   return 'C';
        case Category::EV:    return 'E';
        case Category::HEAVY: return 'H';
        case Category::VIP:   return 'V';
    }
    return '?';
}

bool parseCategory(const string& text, Category& out) {
    size_t b = 0, e = text.size();
    while (b < e && isspace(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(text[e - 1]))) --e;

    string upper;
    for (size_t i = b; i < e; ++i) upper += static_cast<char>(toupper(static_cast<unsigned char>(text[i])));

    for (Category c : constructionOrder()) {
        if (upper == categoryToStr(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

bool isRequestable(Category c) {
    return c == Category::BIKE || c == Category::CAR || c == Category::EV || c == Category::HEAVY;
}

const vector<Category>& constructionOrder() {
    static const vector<Category> order {
        Category::VIP, Category::BIKE, Category::CAR, Category::EV, Category::HEAVY
    };
    return order;
}

const char* errorToStr(ParkError e) {
    switch (e) {
        case ParkError::None:               return "OK";
        case ParkError::InvalidVehicleType: return "INVALID_VEHICLE_TYPE";
        case ParkError::InvalidVehicleId:   return "INVALID_VEHICLE_ID";
        case ParkError::DuplicateVehicle:   return "DUPLICATE_VEHICLE";
        case ParkError::LotFull:            return "LOT_FULL";
        case ParkError::VehicleNotFound:    return "VEHICLE_NOT_FOUND";
        case ParkError::InvalidTimeRange:   return "INVALID_TIME_RANGE";
        case ParkError::InvalidPricing:     return "INVALID_PRICING";
        case ParkError::AlreadyOccupied:    return "ALREADY_OCCUPIED";
        case ParkError::NotOccupied:        return "NOT_OCCUPIED";
        case ParkError::SlotNotFound:       return "SLOT_NOT_FOUND";
    }
    return "UNKNOWN";
}

} // namespace smartpark
