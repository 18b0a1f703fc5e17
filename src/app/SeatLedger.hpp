#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "app/RequestControl.hpp"
#include "domain/domain_model.hpp"

namespace railseat::app {

class IBookingRepository;

enum class LedgerStatus {
    Ok         = 0,
    Conflict   = 1, // seat already claimed for this (train, date)
    OutOfRange = 2, // seat outside 1..totalSeats
    NotFound   = 3, // train does not exist
    Timeout    = 4, // deadline passed while waiting for the key lock
    Failed     = 5, // reading the repository failed
    Aborted    = 6  // caller's abort flag raised while waiting for the key lock
};

// In-process seat occupancy per (train, travel date).
//
// Each key owns its own timed mutex; the key map is guarded separately and
// only for lookup/insert, so claims on different trains or dates never contend.
// A key is hydrated from the repository (capacity + active seats) on first
// touch. A failed hydration is reported and retried on the next touch.
//
// Other processes may write the same store, so a key can go stale. refresh()
// re-reads the active seats and keeps this process's pending claims (claimed,
// not yet confirmed or released) on top of them.
class SeatLedger {
public:
    using Deadline = railseat::app::Deadline;

    explicit SeatLedger(IBookingRepository& repo);

    SeatLedger(const SeatLedger&) = delete;
    SeatLedger& operator=(const SeatLedger&) = delete;

    // Free seats, ascending.
    LedgerStatus availability(railseat::domain::TrainId trainId,
                              railseat::domain::TravelDate date,
                              railseat::domain::SeatSet& out,
                              std::string* errorOut = nullptr,
                              Deadline deadline = Deadline::max(),
                              const AbortFlag* abort = nullptr);

    // availability() after re-reading the key's active seats from the store.
    LedgerStatus refresh(railseat::domain::TrainId trainId,
                         railseat::domain::TravelDate date,
                         railseat::domain::SeatSet& out,
                         std::string* errorOut = nullptr,
                         Deadline deadline = Deadline::max(),
                         const AbortFlag* abort = nullptr);

    // Atomically marks one seat occupied. At most one concurrent claim for the
    // same (train, date, seat) returns Ok.
    LedgerStatus claim(railseat::domain::TrainId trainId,
                       railseat::domain::TravelDate date,
                       int seat,
                       std::string* errorOut = nullptr,
                       Deadline deadline = Deadline::max(),
                       const AbortFlag* abort = nullptr);

    // The claimed seat is now backed by a committed booking.
    void confirm(railseat::domain::TrainId trainId,
                 railseat::domain::TravelDate date,
                 int seat);

    // Reverses a claim. No-op for unclaimed seats and keys never hydrated.
    void release(railseat::domain::TrainId trainId,
                 railseat::domain::TravelDate date,
                 int seat);

    // Occupied seat count; nullopt if the key cannot be hydrated.
    std::optional<int> claimedCount(railseat::domain::TrainId trainId,
                                    railseat::domain::TravelDate date);

    // Drops keys whose travel date is strictly before `date`. Returns how many
    // keys were dropped. Only meant for dates the engine no longer accepts.
    std::size_t evictBefore(railseat::domain::TravelDate date);

    std::size_t trackedKeys() const;

private:
    struct Slot {
        std::timed_mutex  mutex;
        bool              hydrated{false};
        int               totalSeats{0};
        std::vector<bool> occupied; // index = seat - 1
        std::vector<bool> pending;  // claimed here, no committed booking yet
    };

    using Key = std::pair<railseat::domain::TrainId, int>; // (train, yyyymmdd)

    std::shared_ptr<Slot> slotFor(const Key& key, bool create);

    // Locks the key's slot, honouring the deadline and the abort flag.
    LedgerStatus lockSlot(railseat::domain::TrainId trainId,
                          railseat::domain::TravelDate date,
                          Deadline deadline,
                          const AbortFlag* abort,
                          std::shared_ptr<Slot>& slotOut,
                          std::unique_lock<std::timed_mutex>& lockOut,
                          std::string* errorOut);

    // lockSlot() plus hydration on first touch.
    LedgerStatus lockHydrated(railseat::domain::TrainId trainId,
                              railseat::domain::TravelDate date,
                              Deadline deadline,
                              const AbortFlag* abort,
                              std::shared_ptr<Slot>& slotOut,
                              std::unique_lock<std::timed_mutex>& lockOut,
                              std::string* errorOut);

    // (Re)builds occupancy from the store; pending claims stay occupied.
    LedgerStatus hydrate(Slot& slot,
                         railseat::domain::TrainId trainId,
                         railseat::domain::TravelDate date,
                         std::string* errorOut);

    IBookingRepository&                 repo_;
    mutable std::mutex                  mapMutex_;
    std::map<Key, std::shared_ptr<Slot>> slots_;
};

inline std::string to_string(LedgerStatus s) {
    switch (s) {
        case LedgerStatus::Ok:         return "Ok";
        case LedgerStatus::Conflict:   return "Conflict";
        case LedgerStatus::OutOfRange: return "OutOfRange";
        case LedgerStatus::NotFound:   return "NotFound";
        case LedgerStatus::Timeout:    return "Timeout";
        case LedgerStatus::Failed:     return "Failed";
        case LedgerStatus::Aborted:    return "Aborted";
    }
    return "Unknown";
}

} // namespace railseat::app
