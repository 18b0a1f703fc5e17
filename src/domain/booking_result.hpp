#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/domain_model.hpp"

namespace railseat::domain {

// --- Error taxonomy ---------------------------------------------------------

enum class ErrorKind {
    NotFound            = 0, // user/train/booking missing
    InvalidDate         = 1,
    OutOfRange          = 2, // seat number outside capacity
    Full                = 3, // no seats available
    SeatTaken           = 4, // lost a race for a specific seat
    Forbidden           = 5,
    ConstraintViolation = 6, // repository-level uniqueness/foreign key
    PersistenceFailed   = 7,
    Timeout             = 8,
    Aborted             = 9  // caller requested abort of an in-flight book()
};

struct BookingError {
    ErrorKind          kind{ErrorKind::NotFound};
    std::string        message;
    TrainId            trainId{0};
    TravelDate         date;
    std::optional<int> seat;
};

inline std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NotFound:            return "NotFound";
        case ErrorKind::InvalidDate:         return "InvalidDate";
        case ErrorKind::OutOfRange:          return "OutOfRange";
        case ErrorKind::Full:                return "Full";
        case ErrorKind::SeatTaken:           return "SeatTaken";
        case ErrorKind::Forbidden:           return "Forbidden";
        case ErrorKind::ConstraintViolation: return "ConstraintViolation";
        case ErrorKind::PersistenceFailed:   return "PersistenceFailed";
        case ErrorKind::Timeout:             return "Timeout";
        case ErrorKind::Aborted:             return "Aborted";
    }
    return "Unknown";
}

// "<Kind>: <message> (train 3, 2026-10-18, seat 5)"
inline std::string describe(const BookingError& e) {
    std::string out = to_string(e.kind) + ": " + e.message;
    if (e.trainId != 0) {
        out += " (train " + std::to_string(e.trainId);
        if (e.date.ymd != 0) {
            out += ", " + to_string(e.date);
        }
        if (e.seat) {
            out += ", seat " + std::to_string(*e.seat);
        }
        out += ")";
    }
    return out;
}

// --- Operation results ------------------------------------------------------

struct BookingResult {
    std::optional<Booking>      booking;
    std::optional<BookingError> error;
    bool                        replayed{false}; // returned from an earlier call with the same token

    bool ok() const noexcept { return booking.has_value(); }

    static BookingResult success(Booking b, bool replayed = false) {
        BookingResult r;
        r.booking  = std::move(b);
        r.replayed = replayed;
        return r;
    }
    static BookingResult failure(BookingError e) {
        BookingResult r;
        r.error = std::move(e);
        return r;
    }
};

struct CancelResult {
    std::optional<BookingError> error;

    bool ok() const noexcept { return !error.has_value(); }
};

struct SeatSetResult {
    SeatSet                     seats;
    std::optional<BookingError> error;

    bool ok() const noexcept { return !error.has_value(); }
};

struct BookingDetails {
    Booking     booking;
    std::string trainNumber;
    std::string source;
    std::string destination;
};

struct BookingDetailsResult {
    std::optional<BookingDetails> details;
    std::optional<BookingError>   error;

    bool ok() const noexcept { return details.has_value(); }
};

struct RouteAvailabilityResult {
    std::vector<TrainAvailability> trains;
    std::optional<BookingError>    error;

    bool ok() const noexcept { return !error.has_value(); }
};

} // namespace railseat::domain
