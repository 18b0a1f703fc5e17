#pragma once

#include "app/IClock.hpp"

namespace railseat::infra {

// Local calendar date from the system clock.
class SystemClock : public railseat::app::IClock {
public:
    railseat::domain::TravelDate today() const override;
};

} // namespace railseat::infra
