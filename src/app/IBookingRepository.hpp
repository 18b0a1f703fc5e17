#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "app/RequestControl.hpp"
#include "domain/domain_model.hpp"

namespace railseat::app {

enum class StoreStatus {
    Ok                  = 0,
    NotFound            = 1,
    ConstraintViolation = 2, // uniqueness or foreign key failed
    Failed              = 3, // infrastructure failure (I/O, busy, driver)
    RolledBack          = 4, // withTransaction(): fn asked for rollback
    Timeout             = 5  // withTransaction(): store stayed busy until the deadline
};

inline std::string to_string(StoreStatus s) {
    switch (s) {
        case StoreStatus::Ok:                  return "Ok";
        case StoreStatus::NotFound:            return "NotFound";
        case StoreStatus::ConstraintViolation: return "ConstraintViolation";
        case StoreStatus::Failed:              return "Failed";
        case StoreStatus::RolledBack:          return "RolledBack";
        case StoreStatus::Timeout:             return "Timeout";
    }
    return "Unknown";
}

// Port/interface for the durable store behind users/trains/bookings.
// Implementations live in infra (e.g. SQLite via QtSql).
//
// Every call reports a StoreStatus and fills errorOut (when given) with a
// readable reason. Single-row reads return NotFound for a missing row and
// Failed when the store could not be read; the output is only set on Ok.
// All methods may be called concurrently from different threads.
class IBookingRepository {
public:
    virtual ~IBookingRepository() = default;

    // --- Catalog (external admin workflows) ---------------------------------

    // Assigns user.id on success.
    virtual StoreStatus addUser(railseat::domain::User& user, std::string* errorOut) = 0;
    // Assigns train.id on success.
    virtual StoreStatus addTrain(railseat::domain::Train& train, std::string* errorOut) = 0;

    virtual StoreStatus findUser(railseat::domain::UserId id,
                                 railseat::domain::User& out,
                                 std::string* errorOut) const = 0;
    virtual StoreStatus findTrain(railseat::domain::TrainId id,
                                  railseat::domain::Train& out,
                                  std::string* errorOut) const = 0;
    // Ok with an empty list when no train runs the route.
    virtual StoreStatus findTrainsByRoute(const std::string& source,
                                          const std::string& destination,
                                          std::vector<railseat::domain::Train>& out,
                                          std::string* errorOut) const = 0;

    // --- Transactions -------------------------------------------------------

    // Runs fn inside one transaction on the calling thread. fn returns true to
    // commit, false to roll back (-> RolledBack). If fn throws, the transaction
    // is rolled back and the exception is rethrown. Waiting for other writers
    // stops at `deadline` (-> Timeout, fn not called).
    virtual StoreStatus withTransaction(const std::function<bool()>& fn,
                                        std::string* errorOut,
                                        Deadline deadline = Deadline::max()) = 0;

    // --- Bookings -----------------------------------------------------------

    // Assigns booking.id on success. ConstraintViolation when an active booking
    // already holds (train, seat, date) or the idempotency token is taken.
    virtual StoreStatus insertBooking(railseat::domain::Booking& booking, std::string* errorOut) = 0;

    virtual StoreStatus findBooking(railseat::domain::BookingId id,
                                    railseat::domain::Booking& out,
                                    std::string* errorOut) const = 0;
    virtual StoreStatus findBookingByToken(const std::string& token,
                                           railseat::domain::Booking& out,
                                           std::string* errorOut) const = 0;

    // Active -> Cancelled. NotFound when no active booking with this id exists.
    virtual StoreStatus markCancelled(railseat::domain::BookingId id,
                                      railseat::domain::TimePoint at,
                                      std::string* errorOut) = 0;

    // nullopt on read failure.
    virtual std::optional<int> countActiveBookings(railseat::domain::TrainId trainId,
                                                   railseat::domain::TravelDate date) const = 0;

    // Seats held by active bookings, ascending. Used to hydrate and re-sync the seat ledger.
    virtual StoreStatus activeSeats(railseat::domain::TrainId trainId,
                                    railseat::domain::TravelDate date,
                                    std::vector<int>& out,
                                    std::string* errorOut) const = 0;
};

} // namespace railseat::app
