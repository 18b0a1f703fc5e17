#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "app/RequestControl.hpp"
#include "domain/booking_result.hpp"
#include "domain/domain_model.hpp"

namespace railseat::app {

class IBookingRepository;
class IClock;
class ConflictResolver;
class SeatLedger;

struct BookingRequest {
    railseat::domain::UserId         userId{0};
    railseat::domain::TrainId        trainId{0};
    railseat::domain::TravelDate     date;
    railseat::domain::SeatPreference seat;
    std::optional<std::string>       idempotencyToken;

    // Unset -> EngineConfig::defaultTimeoutMs.
    std::optional<std::chrono::milliseconds> timeout;
    const AbortFlag*                         abort{nullptr};
};

// Orchestrates booking end to end: validate, claim a seat in the ledger,
// persist the row, and undo the claim if anything after it fails.
//
// Calls carrying the same idempotency token run one at a time in this process;
// across processes the token's unique index decides and the loser replays.
class ReservationEngine {
public:
    ReservationEngine(IBookingRepository& repo,
                      SeatLedger& ledger,
                      const ConflictResolver& resolver,
                      const IClock& clock,
                      railseat::domain::EngineConfig config = {});

    railseat::domain::BookingResult book(const BookingRequest& request);

    // Owner or admin only. Cancelling an already cancelled booking succeeds.
    railseat::domain::CancelResult cancel(railseat::domain::BookingId bookingId,
                                          railseat::domain::UserId requesterId);

    railseat::domain::SeatSetResult availability(railseat::domain::TrainId trainId,
                                                 railseat::domain::TravelDate date);

    // Bookings of other users are reported as NotFound unless the requester is an admin.
    railseat::domain::BookingDetailsResult bookingDetails(railseat::domain::BookingId bookingId,
                                                          railseat::domain::UserId requesterId) const;

    // Trains on the route with their free seat count for `date`.
    railseat::domain::RouteAvailabilityResult routeAvailability(const std::string& source,
                                                                const std::string& destination,
                                                                railseat::domain::TravelDate date);

    const railseat::domain::EngineConfig& config() const noexcept { return config_; }

private:
    using SteadyClock = std::chrono::steady_clock;

    class TokenLease;

    // Returns the earlier booking for the request's token, if any.
    std::optional<railseat::domain::BookingResult> replayByToken(const BookingRequest& request) const;

    std::optional<railseat::domain::BookingError> validate(const BookingRequest& request) const;

    // Validate, claim and persist; the token (if any) is already leased.
    railseat::domain::BookingResult bookLeased(const BookingRequest& request, Deadline deadline);

    // Claims one seat; on success seatOut holds it and the ledger owns the claim.
    std::optional<railseat::domain::BookingError> claimSeat(const BookingRequest& request,
                                                            Deadline deadline,
                                                            int& seatOut);

    // seatLost is set when the store already holds an active booking for the
    // seat (written by another process); the claim is gone by then.
    railseat::domain::BookingResult persistClaimed(const BookingRequest& request,
                                                   int seat,
                                                   Deadline deadline,
                                                   bool& seatLost);

    // Drops ledger keys for travel dates before today, once per day.
    void evictPastDates();

    std::shared_ptr<std::timed_mutex> acquireTokenMutex(const std::string& token);
    void dropTokenMutex(const std::string& token);

    IBookingRepository&            repo_;
    SeatLedger&                    ledger_;
    const ConflictResolver&        resolver_;
    const IClock&                  clock_;
    railseat::domain::EngineConfig config_;

    std::atomic<int> evictedBefore_{0}; // yyyymmdd of the last eviction

    std::mutex                                               tokenMutex_;
    std::map<std::string, std::shared_ptr<std::timed_mutex>> tokenLocks_;
};

} // namespace railseat::app
