#include "app/ConflictResolver.hpp"

#include <algorithm>

namespace railseat::app {

ConflictResolver::ConflictResolver(int maxAttempts)
    : maxAttempts_(maxAttempts < 1 ? 1 : maxAttempts) {
}

std::optional<int> ConflictResolver::selectSeat(const railseat::domain::SeatSet& freeSeats) const {
    if (freeSeats.empty()) {
        return std::nullopt;
    }
    return *std::min_element(freeSeats.begin(), freeSeats.end());
}

} // namespace railseat::app
