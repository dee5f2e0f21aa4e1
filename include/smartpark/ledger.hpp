#ifndef SMARTPARK_LEDGER_HPP
#define SMARTPARK_LEDGER_HPP

#include <string>
#include <vector>

#include "smartpark/types.hpp"

namespace smartpark {

// Immutable record of one completed visit
struct LedgerEntry {
    std::string vehicleID;
    Category category;      // billing category
    std::string slotID;
    TimePoint entryTime;
    TimePoint exitTime;
    long long billedHours;
    double fee;
};

struct Aggregate {
    size_t count = 0;
    double totalFee = 0.0;
    double averageDurationHours = 0.0;
};

/* ------------------ Ledger ------------------
   Append-only list of completed visits; read side only aggregates.
*/
class Ledger {
private:
    std::vector<LedgerEntry> entries_;

public:
    void append(const LedgerEntry& e) { entries_.push_back(e); }

    const std::vector<LedgerEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    // Zeroed when empty
    Aggregate aggregate() const;
    Aggregate aggregateBy(Category c) const;
};

} // namespace smartpark

#endif
