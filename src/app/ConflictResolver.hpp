#pragma once

#include <optional>

#include "domain/domain_model.hpp"

namespace railseat::app {

// Seat auto-assignment policy for "any seat" requests, kept apart from
// ReservationEngine so policies can change without touching the booking flow.
//
// Rules:
//  - default pick is the lowest-numbered free seat
//  - an empty free set yields nullopt (the engine reports Full)
//  - a lost claim is retried against a refreshed free set, at most
//    maxAttempts() claims per request
class ConflictResolver {
public:
    explicit ConflictResolver(int maxAttempts = 3);
    virtual ~ConflictResolver() = default;

    virtual std::optional<int> selectSeat(const railseat::domain::SeatSet& freeSeats) const;

    int maxAttempts() const noexcept { return maxAttempts_; }

private:
    int maxAttempts_;
};

} // namespace railseat::app
