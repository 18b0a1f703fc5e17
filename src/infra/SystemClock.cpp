#include "infra/SystemClock.hpp"

#include <QDate>

#include "infra/DateFormat.hpp"

namespace railseat::infra {

railseat::domain::TravelDate SystemClock::today() const {
    return fmt::fromQDate(QDate::currentDate());
}

} // namespace railseat::infra
