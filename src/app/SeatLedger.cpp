#include "app/SeatLedger.hpp"

#include <QDebug>

#include <utility>

#include "app/IBookingRepository.hpp"

namespace railseat::app {

using namespace railseat::domain;

namespace {

void setError(std::string* errorOut, std::string message) {
    if (errorOut) {
        *errorOut = std::move(message);
    }
}

std::string keyText(TrainId trainId, TravelDate date) {
    return "train " + std::to_string(trainId) + " on " + to_string(date);
}

void collectFree(const std::vector<bool>& occupied, SeatSet& out) {
    for (std::size_t i = 0; i < occupied.size(); ++i) {
        if (!occupied[i]) {
            out.push_back(static_cast<int>(i) + 1);
        }
    }
}

} // namespace

SeatLedger::SeatLedger(IBookingRepository& repo)
    : repo_(repo) {
}

std::shared_ptr<SeatLedger::Slot> SeatLedger::slotFor(const Key& key, bool create) {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto slot = std::make_shared<Slot>();
    slots_.emplace(key, slot);
    return slot;
}

LedgerStatus SeatLedger::hydrate(Slot& slot, TrainId trainId, TravelDate date, std::string* errorOut) {
    Train train;
    std::string err;
    const StoreStatus found = repo_.findTrain(trainId, train, &err);
    if (found == StoreStatus::NotFound) {
        setError(errorOut, "train " + std::to_string(trainId) + " not found");
        return LedgerStatus::NotFound;
    }
    if (found != StoreStatus::Ok) {
        setError(errorOut, "cannot load train " + std::to_string(trainId) + ": " + err);
        return LedgerStatus::Failed;
    }
    if (train.totalSeats <= 0) {
        setError(errorOut, "train " + std::to_string(trainId) + " has no seats");
        return LedgerStatus::Failed;
    }

    std::vector<int> seats;
    const StoreStatus st = repo_.activeSeats(trainId, date, seats, &err);
    if (st != StoreStatus::Ok) {
        qWarning() << "Seat ledger hydration failed for"
                   << QString::fromStdString(keyText(trainId, date)) << ":"
                   << QString::fromStdString(err);
        setError(errorOut, "cannot load seats for " + keyText(trainId, date) + ": " + err);
        return LedgerStatus::Failed;
    }

    const auto total = static_cast<std::size_t>(train.totalSeats);
    std::vector<bool> occupied(total, false);
    for (int seat : seats) {
        if (seat >= 1 && seat <= train.totalSeats) {
            occupied[static_cast<std::size_t>(seat - 1)] = true;
        } else {
            qWarning() << "Ignoring out-of-range active seat" << seat << "for"
                       << QString::fromStdString(keyText(trainId, date));
        }
    }

    int pendingCount = 0;
    if (slot.hydrated && slot.pending.size() == total) {
        for (std::size_t i = 0; i < total; ++i) {
            if (slot.pending[i]) {
                occupied[i] = true;
                ++pendingCount;
            }
        }
    } else {
        slot.pending.assign(total, false);
    }

    slot.totalSeats = train.totalSeats;
    slot.occupied   = std::move(occupied);
    slot.hydrated   = true;

    qDebug() << "Seat ledger loaded" << QString::fromStdString(keyText(trainId, date))
             << "booked:" << static_cast<int>(seats.size()) << "pending:" << pendingCount
             << "/" << slot.totalSeats;
    return LedgerStatus::Ok;
}

LedgerStatus SeatLedger::lockSlot(TrainId trainId,
                                  TravelDate date,
                                  Deadline deadline,
                                  const AbortFlag* abort,
                                  std::shared_ptr<Slot>& slotOut,
                                  std::unique_lock<std::timed_mutex>& lockOut,
                                  std::string* errorOut) {
    slotOut = slotFor(Key{trainId, date.ymd}, true);
    lockOut = std::unique_lock<std::timed_mutex>(slotOut->mutex, std::defer_lock);

    switch (lockBefore(lockOut, deadline, abort)) {
        case WaitOutcome::Acquired:
            return LedgerStatus::Ok;
        case WaitOutcome::Aborted:
            setError(errorOut, "aborted while waiting for seat ledger of " + keyText(trainId, date));
            return LedgerStatus::Aborted;
        case WaitOutcome::TimedOut:
            break;
    }
    setError(errorOut, "timed out waiting for seat ledger of " + keyText(trainId, date));
    return LedgerStatus::Timeout;
}

LedgerStatus SeatLedger::lockHydrated(TrainId trainId,
                                      TravelDate date,
                                      Deadline deadline,
                                      const AbortFlag* abort,
                                      std::shared_ptr<Slot>& slotOut,
                                      std::unique_lock<std::timed_mutex>& lockOut,
                                      std::string* errorOut) {
    const LedgerStatus st = lockSlot(trainId, date, deadline, abort, slotOut, lockOut, errorOut);
    if (st != LedgerStatus::Ok) {
        return st;
    }
    if (!slotOut->hydrated) {
        return hydrate(*slotOut, trainId, date, errorOut);
    }
    return LedgerStatus::Ok;
}

LedgerStatus SeatLedger::availability(TrainId trainId,
                                      TravelDate date,
                                      SeatSet& out,
                                      std::string* errorOut,
                                      Deadline deadline,
                                      const AbortFlag* abort) {
    out.clear();

    std::shared_ptr<Slot> slot;
    std::unique_lock<std::timed_mutex> lock;
    const LedgerStatus st = lockHydrated(trainId, date, deadline, abort, slot, lock, errorOut);
    if (st != LedgerStatus::Ok) {
        return st;
    }

    collectFree(slot->occupied, out);
    return LedgerStatus::Ok;
}

LedgerStatus SeatLedger::refresh(TrainId trainId,
                                 TravelDate date,
                                 SeatSet& out,
                                 std::string* errorOut,
                                 Deadline deadline,
                                 const AbortFlag* abort) {
    out.clear();

    std::shared_ptr<Slot> slot;
    std::unique_lock<std::timed_mutex> lock;
    LedgerStatus st = lockSlot(trainId, date, deadline, abort, slot, lock, errorOut);
    if (st != LedgerStatus::Ok) {
        return st;
    }

    st = hydrate(*slot, trainId, date, errorOut);
    if (st != LedgerStatus::Ok) {
        return st;
    }

    collectFree(slot->occupied, out);
    return LedgerStatus::Ok;
}

LedgerStatus SeatLedger::claim(TrainId trainId,
                               TravelDate date,
                               int seat,
                               std::string* errorOut,
                               Deadline deadline,
                               const AbortFlag* abort) {
    std::shared_ptr<Slot> slot;
    std::unique_lock<std::timed_mutex> lock;
    const LedgerStatus st = lockHydrated(trainId, date, deadline, abort, slot, lock, errorOut);
    if (st != LedgerStatus::Ok) {
        return st;
    }

    if (seat < 1 || seat > slot->totalSeats) {
        setError(errorOut, "seat " + std::to_string(seat) + " is outside 1.."
                               + std::to_string(slot->totalSeats));
        return LedgerStatus::OutOfRange;
    }

    const auto index = static_cast<std::size_t>(seat - 1);
    if (slot->occupied[index]) {
        setError(errorOut, "seat " + std::to_string(seat) + " already taken on " + keyText(trainId, date));
        return LedgerStatus::Conflict;
    }
    slot->occupied[index] = true;
    slot->pending[index]  = true;
    return LedgerStatus::Ok;
}

void SeatLedger::confirm(TrainId trainId, TravelDate date, int seat) {
    auto slot = slotFor(Key{trainId, date.ymd}, false);
    if (!slot) {
        return;
    }

    std::lock_guard<std::timed_mutex> lock(slot->mutex);
    if (!slot->hydrated || seat < 1 || seat > slot->totalSeats) {
        return;
    }
    slot->pending[static_cast<std::size_t>(seat - 1)] = false;
}

void SeatLedger::release(TrainId trainId, TravelDate date, int seat) {
    auto slot = slotFor(Key{trainId, date.ymd}, false);
    if (!slot) {
        return;
    }

    std::lock_guard<std::timed_mutex> lock(slot->mutex);
    if (!slot->hydrated || seat < 1 || seat > slot->totalSeats) {
        return;
    }
    slot->occupied[static_cast<std::size_t>(seat - 1)] = false;
    slot->pending[static_cast<std::size_t>(seat - 1)]  = false;
}

std::optional<int> SeatLedger::claimedCount(TrainId trainId, TravelDate date) {
    std::shared_ptr<Slot> slot;
    std::unique_lock<std::timed_mutex> lock;
    if (lockHydrated(trainId, date, Deadline::max(), nullptr, slot, lock, nullptr) != LedgerStatus::Ok) {
        return std::nullopt;
    }

    int count = 0;
    for (bool taken : slot->occupied) {
        if (taken) {
            ++count;
        }
    }
    return count;
}

std::size_t SeatLedger::evictBefore(TravelDate date) {
    std::lock_guard<std::mutex> lock(mapMutex_);
    std::size_t dropped = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->first.second < date.ymd) {
            it = slots_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0) {
        qDebug() << "Seat ledger evicted" << static_cast<qulonglong>(dropped)
                 << "keys before" << QString::fromStdString(to_string(date));
    }
    return dropped;
}

std::size_t SeatLedger::trackedKeys() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return slots_.size();
}

} // namespace railseat::app
