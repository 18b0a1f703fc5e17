#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "domain/domain_model.hpp"

namespace railseat::infra::fmt {

// Travel date <-> QDate. An invalid QDate maps to TravelDate{0}.
railseat::domain::TravelDate fromQDate(const QDate& date);
QDate toQDate(railseat::domain::TravelDate date);

// Parse ISO yyyy-MM-dd; nullopt for anything else (including 2026-02-30).
std::optional<railseat::domain::TravelDate> parseIsoDate(const QString& text);

QString formatIsoDate(railseat::domain::TravelDate date);

// Local ISO datetime (Qt::ISODate) for created/cancelled timestamps.
QString formatLocalIso(railseat::domain::TimePoint tp);

} // namespace railseat::infra::fmt
