#include "smartpark/ledger.hpp"

using namespace std;

namespace smartpark {

namespace {

template <typename Pred>
Aggregate summarize(const vector<LedgerEntry>& entries, Pred keep) {
    Aggregate agg;
    long long hours = 0;
    for (const auto& e : entries) {
        if (!keep(e)) continue;
        agg.count++;
        agg.totalFee += e.fee;
        hours += e.billedHours;
    }
    if (agg.count > 0) agg.averageDurationHours = static_cast<double>(hours) / agg.count;
    return agg;
}

} // namespace

Aggregate Ledger::aggregate() const {
    return summarize(entries_, [](const LedgerEntry&) { return true; });
}

Aggregate Ledger::aggregateBy(Category c) const {
    return summarize(entries_, [c](const LedgerEntry& e) { return e.category == c; });
}

} // namespace smartpark
