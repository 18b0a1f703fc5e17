#pragma once

#include "domain/domain_model.hpp"

namespace railseat::app {

// Port/interface for "what day is it" when validating travel dates.
// Implementations live in infra (system clock) and tests (fixed clock).
class IClock {
public:
    virtual ~IClock() = default;

    virtual railseat::domain::TravelDate today() const = 0;
};

} // namespace railseat::app
