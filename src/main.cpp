#include <ctime>
#include <iomanip>            // std::setprecision, std::fixed, std::setw
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "smartpark/parking_lot.hpp"

using namespace std;
using namespace smartpark;

/*
 Smart Parking Management console
  - ParkingLot owns slots, pricing and the revenue ledger
  - this file only parses input and renders results
*/

/* ------------------ ANSI colors ------------------ */
namespace color {
const char* const RESET   = "\033[0m";
const char* const BRIGHT  = "\033[1m";
const char* const RED     = "\033[91m";
const char* const GREEN   = "\033[92m";
const char* const YELLOW  = "\033[93m";
const char* const BLUE    = "\033[94m";
const char* const MAGENTA = "\033[95m";
const char* const CYAN    = "\033[96m";
const char* const WHITE   = "\033[97m";
}

static const string RULE(55, '-');

// Local wall-clock time as YYYY-MM-DD HH:MM:SS
static string formatTime(TimePoint tp) {
    time_t t = chrono::system_clock::to_time_t(tp);
    tm local;
    localtime_r(&t, &local);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

static void banner(const string& title) {
    cout << color::BLUE << color::BRIGHT << string(55, '=') << color::RESET << "\n";
    cout << color::BLUE << color::BRIGHT << "  " << title << color::RESET << "\n";
    cout << color::BLUE << color::BRIGHT << string(55, '=') << color::RESET << "\n";
}

/* -------------------- Input helpers -------------------- */

// readLine: false on end of input
static bool readLine(const string& prompt, string& out) {
    cout << prompt;
    if (!getline(cin, out)) return false;
    return true;
}

// inputNonNegative: robust numeric input in [0, maxValue]; false on end of input
static bool inputNonNegative(const string& prompt, long long& value,
                             long long maxValue = numeric_limits<long long>::max()) {
    while (true) {
        string line;
        if (!readLine(prompt, line)) return false;
        istringstream is(line);
        long long x;
        string rest;
        if (!(is >> x) || (is >> rest)) {
            cout << color::RED << " ❗ Please enter a valid number.\n" << color::RESET;
            continue;
        }
        if (x < 0) {
            cout << color::RED << " ❗ Please enter a non-negative number.\n" << color::RESET;
            continue;
        }
        if (x > maxValue) {
            cout << color::RED << " ❗ Please enter a number no larger than " << maxValue << ".\n" << color::RESET;
            continue;
        }
        value = x;
        return true;
    }
}

static bool inputRate(const string& prompt, double& value) {
    while (true) {
        string line;
        if (!readLine(prompt, line)) return false;
        istringstream is(line);
        double x;
        string rest;
        if (!(is >> x) || (is >> rest) || x < 0) {
            cout << color::RED << " ❗ Please enter a non-negative amount.\n" << color::RESET;
            continue;
        }
        value = x;
        return true;
    }
}

static bool waitForEnter() {
    string ignored;
    return readLine(string(color::YELLOW) + "\nPress Enter to return to menu..." + color::RESET, ignored);
}

/* -------------------- Renderers -------------------- */

static void printEntry(const EntryResult& r, bool isVip) {
    if (r.ok()) {
        const char* c = isVip ? color::CYAN : color::GREEN;
        cout << c << color::BRIGHT << "\n[SUCCESS] Vehicle " << r.vehicleID << " entered." << color::RESET << "\n";
        cout << c << "Allocated Slot: " << r.slotID << " (" << categoryToStr(r.slotCategory) << ")";
        if (r.rule == AllocationRule::Spillover && r.slotCategory == Category::VIP) cout << " [overflow]";
        cout << " | Entry Time: " << formatTime(r.entryTime) << color::RESET << "\n";
        return;
    }
    switch (r.error) {
        case ParkError::InvalidVehicleType:
            cout << color::RED << "\n[ERROR] Invalid vehicle type. Must be BIKE, CAR, EV, or HEAVY." << color::RESET << "\n";
            break;
        case ParkError::InvalidVehicleId:
            cout << color::RED << "\n[ERROR] Vehicle number must not be empty." << color::RESET << "\n";
            break;
        case ParkError::DuplicateVehicle:
            cout << color::YELLOW << "\n[WARN] Vehicle " << r.vehicleID << " is already parked in Slot " << r.slotID << "." << color::RESET << "\n";
            break;
        case ParkError::LotFull:
            cout << color::RED << "\n[FAILURE] Parking lot is full for the requested vehicle type." << color::RESET << "\n";
            break;
        default:
            cout << color::RED << "\n[ERROR] Entry failed: " << errorToStr(r.error) << color::RESET << "\n";
    }
}

static void printReceipt(const ExitResult& r) {
    if (!r.ok()) {
        if (r.error == ParkError::VehicleNotFound)
            cout << color::RED << "\n[ERROR] Vehicle " << r.vehicleID << " not found in the parking lot." << color::RESET << "\n";
        else
            cout << color::RED << "\n[ERROR] Exit failed: " << errorToStr(r.error) << color::RESET << "\n";
        return;
    }
    cout << fixed << setprecision(2);
    cout << color::GREEN << color::BRIGHT << "\n[EXIT REPORT] Vehicle " << r.vehicleID << " exited from Slot " << r.slotID << color::RESET << "\n";
    cout << color::GREEN << RULE << color::RESET << "\n";
    cout << color::YELLOW << "  Billed as     : " << categoryToStr(r.category) << "\n"
         << "  Entry         : " << formatTime(r.entryTime) << "\n"
         << "  Exit          : " << formatTime(r.exitTime) << "\n"
         << "  Duration (Hrs): " << r.billedHours << "\n"
         << "  Total Fee     : $" << r.fee << color::RESET << "\n";
    cout << color::GREEN << RULE << color::RESET << "\n";
    cout << color::MAGENTA << "  Thank you for parking with us!" << color::RESET << "\n";
}

static void displayStatus(const ParkingLot& lot) {
    banner("SMART PARKING LOT STATUS DASHBOARD");
    LotStats st = lot.stats();
    cout << fixed << setprecision(2);
    cout << color::CYAN << "Total Capacity: " << st.total << " | Occupied: " << st.occupied
         << " | Available: " << st.available << color::RESET << "\n";
    cout << color::CYAN << "Utilization: " << st.utilizationPercent << "%" << color::RESET << "\n";
    cout << color::CYAN << "Free:";
    for (Category c : constructionOrder()) cout << " " << categoryToStr(c) << "=" << st.freeByCategory[c];
    cout << color::RESET << "\n" << RULE << "\n";

    cout << color::WHITE << color::BRIGHT << left
         << setw(8) << "SLOT" << " " << setw(15) << "STATUS" << " "
         << setw(8) << "TYPE" << " " << "VEHICLE NO" << color::RESET << "\n";
    for (const auto& v : lot.currentSnapshot()) {
        if (v.occupied) {
            const Reservation& r = v.reservation;
            const char* sc = r.isVip ? color::MAGENTA : color::RED;
            const char* tc = r.isVip ? color::MAGENTA
                           : r.requested == Category::EV ? color::GREEN
                           : r.requested == Category::BIKE ? color::CYAN : color::YELLOW;
            cout << setw(8) << v.slotID << " "
                 << sc << setw(15) << (r.isVip ? "OCCUPIED (VIP)" : "OCCUPIED") << color::RESET << " "
                 << tc << setw(8) << categoryToStr(r.requested) << color::RESET << " "
                 << color::WHITE << r.vehicleID << color::RESET << "\n";
        } else {
            cout << setw(8) << v.slotID << " "
                 << color::GREEN << setw(15) << "AVAILABLE" << color::RESET << " "
                 << setw(8) << categoryToStr(v.category) << "\n";
        }
    }
    cout << right << RULE << "\n";
}

static void displayReport(const ParkingLot& lot) {
    banner("DAILY REVENUE REPORT");
    RevenueReport rep = lot.revenueReport();
    if (rep.entries.empty()) {
        cout << color::YELLOW << "No transactions recorded yet for the day." << color::RESET << "\n" << RULE << "\n";
        return;
    }
    cout << fixed;
    cout << color::GREEN << "Total Revenue Earned: " << color::BRIGHT << "$" << setprecision(2) << rep.total.totalFee << color::RESET << "\n";
    cout << color::GREEN << "Total Vehicles Processed: " << rep.total.count << color::RESET << "\n";
    cout << color::GREEN << "Average Parking Duration: " << setprecision(1) << rep.total.averageDurationHours << " hours" << color::RESET << "\n";
    cout << RULE << "\n";

    cout << color::WHITE << color::BRIGHT << left
         << setw(8) << "SLOT" << " " << setw(12) << "VEHICLE" << " " << setw(8) << "TYPE" << " "
         << setw(10) << "DURATION" << " " << "FEE" << color::RESET << "\n";
    for (const auto& e : rep.entries) {
        cout << setw(8) << e.slotID << " " << setw(12) << e.vehicleID << " "
             << setw(8) << categoryToStr(e.category) << " "
             << setw(10) << e.billedHours << " " << setprecision(2) << e.fee << "\n";
    }
    cout << right << RULE << "\n";
}

/* -------------------- Menu actions -------------------- */

// false on end of input
static bool doEntry(ParkingLot& lot) {
    cout << color::MAGENTA << color::BRIGHT << "--- VEHICLE ENTRY ---" << color::RESET << "\n";
    string vid, type, vip;
    if (!readLine("Enter Vehicle Number: ", vid)) return false;
    if (!readLine("Enter Vehicle Type (BIKE/CAR/EV/HEAVY): ", type)) return false;
    if (!readLine("Is this a VIP/Loyalty Customer? (y/n): ", vip)) return false;
    bool isVip = normalizeVehicleID(vip) == "Y";
    printEntry(lot.vehicleEntry(vid, type, isVip), isVip);
    return true;
}

static bool doExit(ParkingLot& lot) {
    cout << color::MAGENTA << color::BRIGHT << "--- VEHICLE EXIT ---" << color::RESET << "\n";
    string vid;
    if (!readLine("Enter Vehicle Number to Exit: ", vid)) return false;
    printReceipt(lot.vehicleExit(vid));
    return true;
}

static bool doSetPricing(ParkingLot& lot) {
    cout << color::MAGENTA << color::BRIGHT << "--- SET PRICING TIER ---" << color::RESET << "\n";
    cout << fixed << setprecision(2);
    for (const auto& kv : lot.pricing()) {
        cout << "  " << left << setw(6) << categoryToStr(kv.first) << right
             << " first " << kv.second.fixedHours << "h: $" << kv.second.fixedRate
             << ", then $" << kv.second.perHourRate << "/h\n";
    }
    string ts;
    if (!readLine("Category (BIKE/CAR/EV/HEAVY/VIP): ", ts)) return false;
    Category c;
    if (!parseCategory(ts, c)) {
        cout << color::RED << " ❗ Unknown category. Cancelled.\n" << color::RESET;
        return true;
    }
    PricingTier tier;
    if (!inputNonNegative("Hours covered by fixed rate: ", tier.fixedHours)) return false;
    if (!inputRate("Fixed rate: ", tier.fixedRate)) return false;
    if (!inputRate("Rate per extra hour: ", tier.perHourRate)) return false;
    ParkError err = lot.setPricing(c, tier);
    if (err != ParkError::None)
        cout << color::RED << " ❗ Rejected: " << errorToStr(err) << color::RESET << "\n";
    else
        cout << color::GREEN << "✅ Rate set for " << categoryToStr(c) << "." << color::RESET << "\n";
    return true;
}

// Ask for each category's capacity in construction order
static bool promptCapacities(LotConfig& cfg) {
    for (Category c : constructionOrder()) {
        long long n;
        if (!inputNonNegative(string("Number of ") + categoryToStr(c) + " slots: ", n, kMaxCapacity)) return false;
        cfg.capacities[c] = static_cast<int>(n);
    }
    return true;
}

static void usage(ostream& os, const char* prog) {
    os << "Usage: " << prog << " [--seed N] [--no-shuffle] [--custom] [--help]\n"
       << "  --seed N      unsigned seed for slot order shuffling (default: current time)\n"
       << "  --no-shuffle  keep slots in construction order\n"
       << "  --custom      prompt for slot capacities instead of the defaults\n";
}

/* -------------------- main -------------------- */

int main(int argc, char* argv[]) {
    LotConfig cfg = LotConfig::defaults();
    cfg.seed = static_cast<unsigned>(time(nullptr));
    bool custom = false;

    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "--help") {
            usage(cout, argv[0]);
            return 0;
        } else if (arg == "--no-shuffle") {
            cfg.shuffle = false;
        } else if (arg == "--custom") {
            custom = true;
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                cerr << "Missing value for --seed\n";
                usage(cerr, argv[0]);
                return 1;
            }
            if (!parseSeed(argv[++i], cfg.seed)) {
                cerr << "Invalid seed: " << argv[i] << "\n";
                usage(cerr, argv[0]);
                return 1;
            }
        } else {
            cerr << "Unknown argument: " << arg << "\n";
            usage(cerr, argv[0]);
            return 1;
        }
    }

    try {
        cout << "================ Smart Parking Management ================\n";
        if (custom && !promptCapacities(cfg)) {
            cout << color::RED << "\n[SYSTEM] Input stream closed. Exiting gracefully." << color::RESET << "\n";
            return 0;
        }
        ParkingLot lot(cfg);
        cout << "\n✅ Parking initialized: Total slots = " << lot.registry().size() << "\n";

        bool running = true;
        while (running) {
            cout << color::YELLOW << color::BRIGHT << "\n--- MENU ---" << color::RESET << "\n";
            cout << color::GREEN << "1. Vehicle Entry\n2. Vehicle Exit\n3. Parking Status\n4. Revenue Report\n5. Set Pricing Tier\n"
                 << color::RED << "0. Exit System" << color::RESET << "\n";
            long long choice;
            if (!inputNonNegative(string(color::CYAN) + "Choose: " + color::RESET, choice)) {
                cout << color::RED << "\n[SYSTEM] Input stream closed. Exiting gracefully." << color::RESET << "\n";
                break;
            }

            switch (choice) {
                case 0:
                    cout << color::GREEN << color::BRIGHT << "Thank you for using the Smart Parking Management System. Goodbye!" << color::RESET << "\n";
                    running = false;
                    break;
                case 1: running = doEntry(lot) && waitForEnter(); break;
                case 2: running = doExit(lot) && waitForEnter(); break;
                case 3: displayStatus(lot); running = waitForEnter(); break;
                case 4: displayReport(lot); running = waitForEnter(); break;
                case 5: running = doSetPricing(lot) && waitForEnter(); break;
                default:
                    cout << color::RED << " ❗ Invalid choice. Try again." << color::RESET << "\n";
            }
        }
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
