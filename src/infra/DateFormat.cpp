#include "infra/DateFormat.hpp"

#include <QDateTime>
#include <QTimeZone>
#include <chrono>

namespace railseat::infra::fmt {

using railseat::domain::TravelDate;

TravelDate fromQDate(const QDate& date) {
    if (!date.isValid()) {
        return TravelDate{};
    }
    return railseat::domain::makeDate(date.year(), date.month(), date.day());
}

QDate toQDate(TravelDate date) {
    return QDate(date.year(), date.month(), date.day());
}

std::optional<TravelDate> parseIsoDate(const QString& text) {
    const QDate d = QDate::fromString(text.trimmed(), QStringLiteral("yyyy-MM-dd"));
    if (!d.isValid()) {
        return std::nullopt;
    }
    return fromQDate(d);
}

QString formatIsoDate(TravelDate date) {
    return toQDate(date).toString(Qt::ISODate);
}

QString formatLocalIso(railseat::domain::TimePoint tp) {
    const auto ms = static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc());
    return dt.toLocalTime().toString(Qt::ISODate);
}

} // namespace railseat::infra::fmt
