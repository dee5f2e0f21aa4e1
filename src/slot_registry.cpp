#include "smartpark/slot_registry.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace smartpark {

string makeSlotID(Category c, int seq) {
    ostringstream os;
    os << categoryPrefix(c) << '-' << setw(2) << setfill('0') << seq;
    return os.str();
}

void SlotRegistry::initialize(const map<Category, int>& capacities, bool shuffle, unsigned seed) {
    for (const auto& kv : capacities) {
        if (kv.second < 0) {
            throw invalid_argument(string("negative capacity for ") + categoryToStr(kv.first));
        }
        if (kv.second > kMaxCapacity) {
            throw invalid_argument(string("capacity above ") + to_string(kMaxCapacity) + " for " + categoryToStr(kv.first));
        }
    }

    slots_.clear();
    index_.clear();

    for (Category c : constructionOrder()) {
        auto it = capacities.find(c);
        int count = it == capacities.end() ? 0 : it->second;
        for (int seq = 1; seq <= count; ++seq) slots_.emplace_back(makeSlotID(c, seq), c);
    }

    if (shuffle) {
        mt19937 rng(seed);
        std::shuffle(slots_.begin(), slots_.end(), rng);
    }

    for (size_t i = 0; i < slots_.size(); ++i) index_[slots_[i].id()] = i;
}

bool SlotRegistry::findByVehicle(const string& vehicleID, string& slotID) const {
    for (const auto& s : slots_) {
        if (s.occupied() && s.reservation().vehicleID == vehicleID) {
            slotID = s.id();
            return true;
        }
    }
    return false;
}

ParkError SlotRegistry::reserve(const string& slotID, const Reservation& r) {
    auto it = index_.find(slotID);
    if (it == index_.end()) return ParkError::SlotNotFound;
    Slot& s = slots_[it->second];
    if (s.occupied()) return ParkError::AlreadyOccupied;
    s.assign(r);
    return ParkError::None;
}

ReleaseResult SlotRegistry::release(const string& slotID) {
    ReleaseResult res;
    auto it = index_.find(slotID);
    if (it == index_.end()) {
        res.error = ParkError::SlotNotFound;
        return res;
    }
    Slot& s = slots_[it->second];
    if (!s.occupied()) {
        res.error = ParkError::NotOccupied;
        return res;
    }
    res.reservation = s.release();
    return res;
}

vector<SlotView> SlotRegistry::snapshot() const {
    vector<SlotView> views;
    views.reserve(slots_.size());
    for (const auto& s : slots_) {
        views.push_back(SlotView{s.id(), s.category(), s.occupied(), s.reservation()});
    }
    sort(views.begin(), views.end(),
         [](const SlotView& a, const SlotView& b) { return a.slotID < b.slotID; });
    return views;
}

const Slot* SlotRegistry::find(const string& slotID) const {
    auto it = index_.find(slotID);
    return it == index_.end() ? nullptr : &slots_[it->second];
}

size_t SlotRegistry::occupiedCount() const {
    size_t n = 0;
    for (const auto& s : slots_) if (s.occupied()) ++n;
    return n;
}

size_t SlotRegistry::freeCount(Category c) const {
    size_t n = 0;
    for (const auto& s : slots_) if (s.category() == c && !s.occupied()) ++n;
    return n;
}

size_t SlotRegistry::capacity(Category c) const {
    size_t n = 0;
    for (const auto& s : slots_) if (s.category() == c) ++n;
    return n;
}

} // namespace smartpark
