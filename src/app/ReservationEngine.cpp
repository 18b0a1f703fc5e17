#include "app/ReservationEngine.hpp"

#include <QDebug>

#include <algorithm>
#include <utility>

#include "app/ConflictResolver.hpp"
#include "app/IBookingRepository.hpp"
#include "app/IClock.hpp"
#include "app/SeatLedger.hpp"

namespace railseat::app {

using namespace railseat::domain;

namespace {

BookingError makeError(ErrorKind kind,
                       std::string message,
                       TrainId trainId = 0,
                       TravelDate date = {},
                       std::optional<int> seat = std::nullopt) {
    BookingError e;
    e.kind    = kind;
    e.message = std::move(message);
    e.trainId = trainId;
    e.date    = date;
    e.seat    = seat;
    return e;
}

// Ledger failures that are not seat outcomes map onto the same kinds for every caller.
ErrorKind kindFor(LedgerStatus st) {
    switch (st) {
        case LedgerStatus::Conflict:   return ErrorKind::SeatTaken;
        case LedgerStatus::OutOfRange: return ErrorKind::OutOfRange;
        case LedgerStatus::NotFound:   return ErrorKind::NotFound;
        case LedgerStatus::Timeout:    return ErrorKind::Timeout;
        case LedgerStatus::Aborted:    return ErrorKind::Aborted;
        case LedgerStatus::Failed:
        case LedgerStatus::Ok:
            break;
    }
    return ErrorKind::PersistenceFailed;
}

bool isAborted(const BookingRequest& r) {
    return isRequested(r.abort);
}

bool sameRequest(const Booking& b, const BookingRequest& r) {
    return b.userId == r.userId && b.trainId == r.trainId && b.bookingDate == r.date;
}

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

bool isFree(const SeatSet& freeSeats, int seat) {
    return std::binary_search(freeSeats.begin(), freeSeats.end(), seat);
}

} // namespace

// Holds the in-process lock for one idempotency token; the map entry goes
// away with the last lease.
class ReservationEngine::TokenLease {
public:
    TokenLease(ReservationEngine& engine, const std::string& token)
        : engine_(engine)
        , token_(token)
        , mutex_(engine.acquireTokenMutex(token))
        , lock_(*mutex_, std::defer_lock) {
    }

    ~TokenLease() {
        if (lock_.owns_lock()) {
            lock_.unlock();
        }
        lock_ = std::unique_lock<std::timed_mutex>();
        mutex_.reset();
        engine_.dropTokenMutex(token_);
    }

    TokenLease(const TokenLease&) = delete;
    TokenLease& operator=(const TokenLease&) = delete;

    WaitOutcome wait(Deadline deadline, const AbortFlag* abort) {
        return lockBefore(lock_, deadline, abort);
    }

private:
    ReservationEngine&                   engine_;
    std::string                          token_;
    std::shared_ptr<std::timed_mutex>    mutex_;
    std::unique_lock<std::timed_mutex>   lock_;
};

ReservationEngine::ReservationEngine(IBookingRepository& repo,
                                     SeatLedger& ledger,
                                     const ConflictResolver& resolver,
                                     const IClock& clock,
                                     EngineConfig config)
    : repo_(repo)
    , ledger_(ledger)
    , resolver_(resolver)
    , clock_(clock)
    , config_(std::move(config)) {
}

std::shared_ptr<std::timed_mutex> ReservationEngine::acquireTokenMutex(const std::string& token) {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    auto& slot = tokenLocks_[token];
    if (!slot) {
        slot = std::make_shared<std::timed_mutex>();
    }
    return slot;
}

void ReservationEngine::dropTokenMutex(const std::string& token) {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    auto it = tokenLocks_.find(token);
    // Copies are only handed out under tokenMutex_, so a count of one is final.
    if (it != tokenLocks_.end() && it->second.use_count() == 1) {
        tokenLocks_.erase(it);
    }
}

void ReservationEngine::evictPastDates() {
    const int today = clock_.today().ymd;
    int seen = evictedBefore_.load();
    while (today > seen) {
        if (evictedBefore_.compare_exchange_weak(seen, today)) {
            ledger_.evictBefore(TravelDate{today});
            return;
        }
    }
}

std::optional<BookingResult> ReservationEngine::replayByToken(const BookingRequest& request) const {
    if (!request.idempotencyToken || request.idempotencyToken->empty()) {
        return std::nullopt;
    }

    Booking existing;
    std::string err;
    const StoreStatus st = repo_.findBookingByToken(*request.idempotencyToken, existing, &err);
    if (st == StoreStatus::NotFound) {
        return std::nullopt;
    }
    if (st != StoreStatus::Ok) {
        return BookingResult::failure(makeError(
            ErrorKind::PersistenceFailed, "cannot look up idempotency token: " + err,
            request.trainId, request.date));
    }

    if (!sameRequest(existing, request)) {
        return BookingResult::failure(makeError(
            ErrorKind::ConstraintViolation,
            "idempotency token '" + *request.idempotencyToken + "' was used for a different booking",
            request.trainId, request.date));
    }

    qDebug() << "Replaying booking" << existing.id << "for token" << qs(*request.idempotencyToken);
    return BookingResult::success(std::move(existing), true);
}

std::optional<BookingError> ReservationEngine::validate(const BookingRequest& request) const {
    std::string err;

    User user;
    StoreStatus st = repo_.findUser(request.userId, user, &err);
    if (st == StoreStatus::NotFound) {
        return makeError(ErrorKind::NotFound, "user " + std::to_string(request.userId) + " not found");
    }
    if (st != StoreStatus::Ok) {
        return makeError(ErrorKind::PersistenceFailed,
                         "cannot load user " + std::to_string(request.userId) + ": " + err);
    }

    Train train;
    st = repo_.findTrain(request.trainId, train, &err);
    if (st == StoreStatus::NotFound) {
        return makeError(ErrorKind::NotFound, "train " + std::to_string(request.trainId) + " not found",
                         request.trainId);
    }
    if (st != StoreStatus::Ok) {
        return makeError(ErrorKind::PersistenceFailed,
                         "cannot load train " + std::to_string(request.trainId) + ": " + err,
                         request.trainId);
    }

    if (!request.date.isValid()) {
        return makeError(ErrorKind::InvalidDate, "not a calendar date: " + std::to_string(request.date.ymd),
                         request.trainId);
    }

    const TravelDate today = clock_.today();
    if (request.date < today) {
        return makeError(ErrorKind::InvalidDate, "travel date is in the past (today is " + to_string(today) + ")",
                         request.trainId, request.date);
    }
    if (!config_.allowSameDayBooking && request.date == today) {
        return makeError(ErrorKind::InvalidDate, "same-day booking is disabled",
                         request.trainId, request.date);
    }

    return std::nullopt;
}

std::optional<BookingError> ReservationEngine::claimSeat(const BookingRequest& request,
                                                         Deadline deadline,
                                                         int& seatOut) {
    const TrainId trainId = request.trainId;
    const TravelDate date = request.date;
    std::string err;

    // Start from the store's view; other processes may have booked since the key was loaded.
    SeatSet freeSeats;
    LedgerStatus st = ledger_.refresh(trainId, date, freeSeats, &err, deadline, request.abort);
    if (st != LedgerStatus::Ok) {
        return makeError(kindFor(st), err, trainId, date);
    }
    if (freeSeats.empty()) {
        return makeError(ErrorKind::Full, "no seats left", trainId, date);
    }

    if (!request.seat.isAny()) {
        const int seat = *request.seat.seat;
        st = ledger_.claim(trainId, date, seat, &err, deadline, request.abort);
        if (st != LedgerStatus::Ok) {
            return makeError(kindFor(st), err, trainId, date, seat);
        }
        seatOut = seat;
        return std::nullopt;
    }

    // "Any": pick from the current free set, refresh it after every lost race.
    const int attempts = resolver_.maxAttempts();
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            st = ledger_.availability(trainId, date, freeSeats, &err, deadline, request.abort);
            if (st != LedgerStatus::Ok) {
                return makeError(kindFor(st), err, trainId, date);
            }
        }

        const auto pick = resolver_.selectSeat(freeSeats);
        if (!pick) {
            return makeError(ErrorKind::Full, "no seats left", trainId, date);
        }

        st = ledger_.claim(trainId, date, *pick, &err, deadline, request.abort);
        if (st == LedgerStatus::Ok) {
            seatOut = *pick;
            return std::nullopt;
        }
        if (st != LedgerStatus::Conflict) {
            return makeError(kindFor(st), err, trainId, date, *pick);
        }

        qDebug() << "Auto-assign lost seat" << *pick << "on train" << trainId
                 << "attempt" << attempt << "of" << attempts;
    }

    return makeError(ErrorKind::SeatTaken,
                     "lost every auto-assign attempt (" + std::to_string(attempts) + ")",
                     trainId, date);
}

BookingResult ReservationEngine::persistClaimed(const BookingRequest& request,
                                                int seat,
                                                Deadline deadline,
                                                bool& seatLost) {
    const TrainId trainId = request.trainId;
    const TravelDate date = request.date;
    seatLost = false;

    auto compensate = [&](ErrorKind kind, const std::string& message) {
        ledger_.release(trainId, date, seat);
        qWarning() << "Released seat" << seat << "on train" << trainId << qs(to_string(date))
                   << "after" << qs(to_string(kind)) << ":" << qs(message);
        return BookingResult::failure(makeError(kind, message, trainId, date, seat));
    };

    if (isAborted(request)) {
        return compensate(ErrorKind::Aborted, "aborted by caller");
    }
    if (SteadyClock::now() >= deadline) {
        return compensate(ErrorKind::Timeout, "deadline passed before the booking was stored");
    }

    Booking booking;
    booking.userId           = request.userId;
    booking.trainId          = trainId;
    booking.seatNumber       = seat;
    booking.bookingDate      = date;
    booking.status           = BookingStatus::Active;
    booking.idempotencyToken = request.idempotencyToken;
    booking.createdAt        = Clock::now();

    StoreStatus insertStatus = StoreStatus::Failed;
    std::string insertErr;
    bool abortedInTx  = false;
    bool timedOutInTx = false;

    std::string txErr;
    const StoreStatus txStatus = repo_.withTransaction([&]() {
        insertStatus = repo_.insertBooking(booking, &insertErr);
        if (insertStatus != StoreStatus::Ok) {
            return false;
        }
        // Last exit before commit: anything decided here rolls the row back.
        if (isAborted(request)) {
            abortedInTx = true;
            return false;
        }
        if (SteadyClock::now() >= deadline) {
            timedOutInTx = true;
            return false;
        }
        return true;
    }, &txErr, deadline);

    if (txStatus == StoreStatus::Ok) {
        ledger_.confirm(trainId, date, seat);
        qInfo() << "Booked seat" << seat << "on train" << trainId << qs(to_string(date))
                << "for user" << request.userId << "as booking" << booking.id;
        return BookingResult::success(std::move(booking));
    }

    if (abortedInTx) {
        return compensate(ErrorKind::Aborted, "aborted by caller");
    }
    if (timedOutInTx) {
        return compensate(ErrorKind::Timeout, "deadline passed before commit");
    }
    if (txStatus == StoreStatus::Timeout) {
        return compensate(ErrorKind::Timeout, "store stayed busy until the deadline: " + txErr);
    }

    if (insertStatus == StoreStatus::ConstraintViolation) {
        ledger_.release(trainId, date, seat);

        // A concurrent call with the same token may have won the insert.
        if (auto replay = replayByToken(request)) {
            return *replay;
        }

        // Otherwise another process may hold the seat; re-read the key to find out.
        SeatSet freeNow;
        std::string syncErr;
        if (ledger_.refresh(trainId, date, freeNow, &syncErr) == LedgerStatus::Ok && !isFree(freeNow, seat)) {
            seatLost = true;
            qWarning() << "Seat" << seat << "on train" << trainId << qs(to_string(date))
                       << "is already booked in the store; ledger re-synced";
            return BookingResult::failure(makeError(ErrorKind::SeatTaken, "seat was booked by another writer",
                                                    trainId, date, seat));
        }

        qWarning() << "Released seat" << seat << "on train" << trainId << qs(to_string(date))
                   << "after ConstraintViolation:" << qs(insertErr);
        return BookingResult::failure(makeError(ErrorKind::ConstraintViolation, insertErr, trainId, date, seat));
    }

    const std::string& reason = insertStatus != StoreStatus::Ok ? insertErr : txErr;
    return compensate(ErrorKind::PersistenceFailed,
                      reason.empty() ? "store returned " + to_string(txStatus) : reason);
}

BookingResult ReservationEngine::bookLeased(const BookingRequest& request, Deadline deadline) {
    if (auto replay = replayByToken(request)) {
        return *replay;
    }

    if (auto err = validate(request)) {
        return BookingResult::failure(std::move(*err));
    }

    if (isAborted(request)) {
        return BookingResult::failure(makeError(ErrorKind::Aborted, "aborted by caller",
                                                request.trainId, request.date));
    }

    // A seat lost to another process sends "any" back to the ledger for a new pick.
    const int rounds = request.seat.isAny() ? resolver_.maxAttempts() : 1;
    for (int round = 1;; ++round) {
        int seat = 0;
        if (auto err = claimSeat(request, deadline, seat)) {
            return BookingResult::failure(std::move(*err));
        }

        bool seatLost = false;
        BookingResult result = persistClaimed(request, seat, deadline, seatLost);
        if (!seatLost || round >= rounds) {
            return result;
        }
        qDebug() << "Retrying auto-assign on train" << request.trainId << "after losing seat" << seat
                 << "to another writer, round" << round << "of" << rounds;
    }
}

BookingResult ReservationEngine::book(const BookingRequest& request) {
    const auto timeout = request.timeout.value_or(std::chrono::milliseconds(config_.defaultTimeoutMs));
    const Deadline deadline = SteadyClock::now() + timeout;

    evictPastDates();

    if (!request.idempotencyToken || request.idempotencyToken->empty()) {
        return bookLeased(request, deadline);
    }

    TokenLease lease(*this, *request.idempotencyToken);
    switch (lease.wait(deadline, request.abort)) {
        case WaitOutcome::Acquired:
            return bookLeased(request, deadline);
        case WaitOutcome::Aborted:
            return BookingResult::failure(makeError(ErrorKind::Aborted, "aborted by caller",
                                                    request.trainId, request.date));
        case WaitOutcome::TimedOut:
            break;
    }
    return BookingResult::failure(makeError(ErrorKind::Timeout,
                                            "timed out behind another call with the same idempotency token",
                                            request.trainId, request.date));
}

CancelResult ReservationEngine::cancel(BookingId bookingId, UserId requesterId) {
    CancelResult result;
    std::string err;

    Booking booking;
    StoreStatus st = repo_.findBooking(bookingId, booking, &err);
    if (st == StoreStatus::NotFound) {
        result.error = makeError(ErrorKind::NotFound, "booking " + std::to_string(bookingId) + " not found");
        return result;
    }
    if (st != StoreStatus::Ok) {
        result.error = makeError(ErrorKind::PersistenceFailed,
                                 "cannot load booking " + std::to_string(bookingId) + ": " + err);
        return result;
    }

    User requester;
    st = repo_.findUser(requesterId, requester, &err);
    if (st == StoreStatus::NotFound) {
        result.error = makeError(ErrorKind::NotFound, "user " + std::to_string(requesterId) + " not found");
        return result;
    }
    if (st != StoreStatus::Ok) {
        result.error = makeError(ErrorKind::PersistenceFailed,
                                 "cannot load user " + std::to_string(requesterId) + ": " + err);
        return result;
    }

    if (booking.userId != requester.id && !requester.isAdmin) {
        result.error = makeError(ErrorKind::Forbidden,
                                 "user " + std::to_string(requesterId) + " may not cancel booking "
                                     + std::to_string(bookingId),
                                 booking.trainId, booking.bookingDate, booking.seatNumber);
        return result;
    }

    if (booking.status == BookingStatus::Cancelled) {
        return result;
    }

    StoreStatus markStatus = StoreStatus::Failed;
    std::string markErr;
    std::string txErr;
    const StoreStatus txStatus = repo_.withTransaction([&]() {
        markStatus = repo_.markCancelled(bookingId, Clock::now(), &markErr);
        return markStatus == StoreStatus::Ok;
    }, &txErr);

    if (txStatus == StoreStatus::Ok) {
        ledger_.release(booking.trainId, booking.bookingDate, booking.seatNumber);
        qInfo() << "Cancelled booking" << bookingId << "seat" << booking.seatNumber
                << "on train" << booking.trainId << "by user" << requesterId;
        return result;
    }

    if (markStatus == StoreStatus::NotFound) {
        // Lost to a concurrent cancel; that call releases the seat.
        return result;
    }

    const std::string& reason = markStatus != StoreStatus::Ok ? markErr : txErr;
    result.error = makeError(markStatus == StoreStatus::ConstraintViolation ? ErrorKind::ConstraintViolation
                                                                             : ErrorKind::PersistenceFailed,
                             reason.empty() ? "store returned " + to_string(txStatus) : reason,
                             booking.trainId, booking.bookingDate, booking.seatNumber);
    return result;
}

SeatSetResult ReservationEngine::availability(TrainId trainId, TravelDate date) {
    SeatSetResult result;
    if (!date.isValid()) {
        result.error = makeError(ErrorKind::InvalidDate, "not a calendar date: " + std::to_string(date.ymd),
                                 trainId);
        return result;
    }

    evictPastDates();

    std::string err;
    const LedgerStatus st = ledger_.refresh(trainId, date, result.seats, &err);
    if (st != LedgerStatus::Ok) {
        result.error = makeError(kindFor(st), err, trainId, date);
    }
    return result;
}

BookingDetailsResult ReservationEngine::bookingDetails(BookingId bookingId, UserId requesterId) const {
    BookingDetailsResult result;
    const std::string notFound = "booking " + std::to_string(bookingId) + " not found";
    std::string err;

    Booking booking;
    StoreStatus st = repo_.findBooking(bookingId, booking, &err);
    if (st == StoreStatus::Ok) {
        User requester;
        st = repo_.findUser(requesterId, requester, &err);
        if (st == StoreStatus::Ok && booking.userId != requester.id && !requester.isAdmin) {
            st = StoreStatus::NotFound;
        }
    }
    if (st == StoreStatus::NotFound) {
        result.error = makeError(ErrorKind::NotFound, notFound);
        return result;
    }
    if (st != StoreStatus::Ok) {
        result.error = makeError(ErrorKind::PersistenceFailed, "cannot load booking details: " + err);
        return result;
    }

    Train train;
    st = repo_.findTrain(booking.trainId, train, &err);
    if (st != StoreStatus::Ok) {
        result.error = makeError(st == StoreStatus::NotFound ? ErrorKind::NotFound : ErrorKind::PersistenceFailed,
                                 "cannot load train " + std::to_string(booking.trainId) + ": " + err,
                                 booking.trainId);
        return result;
    }

    BookingDetails details;
    details.booking     = std::move(booking);
    details.trainNumber = train.trainNumber;
    details.source      = train.source;
    details.destination = train.destination;
    result.details = std::move(details);
    return result;
}

RouteAvailabilityResult ReservationEngine::routeAvailability(const std::string& source,
                                                             const std::string& destination,
                                                             TravelDate date) {
    RouteAvailabilityResult result;
    if (!date.isValid()) {
        result.error = makeError(ErrorKind::InvalidDate, "not a calendar date: " + std::to_string(date.ymd));
        return result;
    }

    std::string err;
    std::vector<Train> trains;
    const StoreStatus listed = repo_.findTrainsByRoute(source, destination, trains, &err);
    if (listed != StoreStatus::Ok) {
        result.error = makeError(ErrorKind::PersistenceFailed,
                                 "cannot list trains from " + source + " to " + destination + ": " + err);
        return result;
    }

    for (auto& train : trains) {
        SeatSet freeSeats;
        const LedgerStatus st = ledger_.refresh(train.id, date, freeSeats, &err);
        if (st != LedgerStatus::Ok) {
            result.trains.clear();
            result.error = makeError(kindFor(st), err, train.id, date);
            return result;
        }

        TrainAvailability a;
        a.freeSeats = static_cast<int>(freeSeats.size());
        a.train     = std::move(train);
        result.trains.push_back(std::move(a));
    }
    return result;
}

} // namespace railseat::app
