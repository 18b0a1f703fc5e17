#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace railseat::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using UserId    = std::int64_t;
using TrainId   = std::int64_t;
using BookingId = std::int64_t;
using SeatSet   = std::vector<int>; // sorted seat numbers (1-based)

// --- Travel date ------------------------------------------------------------

// Calendar date stored as YYYYMMDD (e.g. 20261018). Default-constructed value is 0
// and is never valid.
struct TravelDate {
    int ymd{0};

    int year() const noexcept  { return ymd / 10000; }
    int month() const noexcept { return (ymd / 100) % 100; }
    int day() const noexcept   { return ymd % 100; }

    bool isValid() const noexcept {
        const int y = year();
        const int m = month();
        const int d = day();
        if (y < 1 || m < 1 || m > 12 || d < 1) {
            return false;
        }
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
        const int maxDay = (m == 2 && leap) ? 29 : kDays[m - 1];
        return d <= maxDay;
    }

    friend bool operator==(TravelDate a, TravelDate b) noexcept { return a.ymd == b.ymd; }
    friend bool operator!=(TravelDate a, TravelDate b) noexcept { return a.ymd != b.ymd; }
    friend bool operator<(TravelDate a, TravelDate b) noexcept  { return a.ymd < b.ymd; }
    friend bool operator<=(TravelDate a, TravelDate b) noexcept { return a.ymd <= b.ymd; }
    friend bool operator>(TravelDate a, TravelDate b) noexcept  { return a.ymd > b.ymd; }
};

inline TravelDate makeDate(int year, int month, int day) {
    return TravelDate{year * 10000 + month * 100 + day};
}

// --- Catalog ----------------------------------------------------------------

struct User {
    UserId      id{0};
    std::string username;
    std::string email;
    bool        isAdmin{false};
    TimePoint   createdAt{Clock::now()};
};

struct Train {
    TrainId     id{0};
    std::string trainNumber;
    std::string source;
    std::string destination;
    int         totalSeats{0};
    TimePoint   createdAt{Clock::now()};
};

// --- Booking ----------------------------------------------------------------

enum class BookingStatus {
    Active    = 0,
    Cancelled = 1 // terminal
};

struct Booking {
    BookingId                  id{0};
    UserId                     userId{0};
    TrainId                    trainId{0};
    int                        seatNumber{0};
    TravelDate                 bookingDate;
    BookingStatus              status{BookingStatus::Active};
    std::optional<std::string> idempotencyToken;

    TimePoint                  createdAt{Clock::now()};
    std::optional<TimePoint>   cancelledAt;
};

// A seat preference is either a concrete seat number or "any" (nullopt).
struct SeatPreference {
    std::optional<int> seat;

    static SeatPreference any() { return {}; }
    static SeatPreference exact(int seatNumber) { return {seatNumber}; }

    bool isAny() const noexcept { return !seat.has_value(); }
};

// Per-train free seat summary for route queries.
struct TrainAvailability {
    Train train;
    int   freeSeats{0};
};

// --- Configuration ----------------------------------------------------------

struct EngineConfig {
    std::string databasePath{"railseat.sqlite"};
    int         maxAssignAttempts{3};
    int         defaultTimeoutMs{5000};
    int         busyTimeoutMs{5000};
    bool        allowSameDayBooking{true};
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(BookingStatus s) {
    switch (s) {
        case BookingStatus::Active:    return "Active";
        case BookingStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// ISO yyyy-MM-dd, zero padded.
inline std::string to_string(TravelDate d) {
    std::string y = std::to_string(d.year());
    while (y.size() < 4) y.insert(y.begin(), '0');
    std::string m = std::to_string(d.month());
    if (m.size() < 2) m.insert(m.begin(), '0');
    std::string dd = std::to_string(d.day());
    if (dd.size() < 2) dd.insert(dd.begin(), '0');
    return y + "-" + m + "-" + dd;
}

} // namespace railseat::domain
