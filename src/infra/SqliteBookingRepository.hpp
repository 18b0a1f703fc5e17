#pragma once

#include <QString>
#include <QStringList>
#include <QtSql/QSqlDatabase>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"
#include "app/IBookingRepository.hpp"

namespace railseat::infra {

// Booking store on SQLite via QtSql.
//
// Tables: users, trains, bookings (+ meta for the schema version). Active
// bookings are unique per (train_id, seat_number, booking_date) through a
// partial unique index; cancelled rows stay for audit.
//
// QtSql connections are thread-bound, so every calling thread gets its own
// named connection to the same database file. A thread's connections are closed
// when it exits. Transactions use BEGIN IMMEDIATE so concurrent writers queue on
// the busy timeout (capped by the caller's deadline) instead of failing on upgrade.
class SqliteBookingRepository : public railseat::app::IBookingRepository {
public:
    SqliteBookingRepository(const QString& dbPath, int busyTimeoutMs = 5000);
    ~SqliteBookingRepository() override;

    SqliteBookingRepository(const SqliteBookingRepository&) = delete;
    SqliteBookingRepository& operator=(const SqliteBookingRepository&) = delete;

    // False when the database could not be opened or the schema not created.
    bool isReady() const noexcept { return ready_; }

    railseat::app::StoreStatus addUser(railseat::domain::User& user, std::string* errorOut) override;
    railseat::app::StoreStatus addTrain(railseat::domain::Train& train, std::string* errorOut) override;

    railseat::app::StoreStatus findUser(railseat::domain::UserId id,
                                        railseat::domain::User& out,
                                        std::string* errorOut) const override;
    railseat::app::StoreStatus findTrain(railseat::domain::TrainId id,
                                         railseat::domain::Train& out,
                                         std::string* errorOut) const override;
    railseat::app::StoreStatus findTrainsByRoute(const std::string& source,
                                                 const std::string& destination,
                                                 std::vector<railseat::domain::Train>& out,
                                                 std::string* errorOut) const override;

    railseat::app::StoreStatus withTransaction(const std::function<bool()>& fn,
                                               std::string* errorOut,
                                               railseat::app::Deadline deadline = railseat::app::Deadline::max()) override;

    railseat::app::StoreStatus insertBooking(railseat::domain::Booking& booking, std::string* errorOut) override;

    railseat::app::StoreStatus findBooking(railseat::domain::BookingId id,
                                           railseat::domain::Booking& out,
                                           std::string* errorOut) const override;
    railseat::app::StoreStatus findBookingByToken(const std::string& token,
                                                  railseat::domain::Booking& out,
                                                  std::string* errorOut) const override;

    railseat::app::StoreStatus markCancelled(railseat::domain::BookingId id,
                                             railseat::domain::TimePoint at,
                                             std::string* errorOut) override;

    std::optional<int> countActiveBookings(railseat::domain::TrainId trainId,
                                           railseat::domain::TravelDate date) const override;

    railseat::app::StoreStatus activeSeats(railseat::domain::TrainId trainId,
                                           railseat::domain::TravelDate date,
                                           std::vector<int>& out,
                                           std::string* errorOut) const override;

private:
    // Connection owned by the calling thread (opened on first use).
    QSqlDatabase connection() const;
    QString connectionName() const;

    bool initSchema(QString* errorOut) const;

    QString            dbPath_;
    QString            connPrefix_;
    int                busyTimeoutMs_;
    bool               ready_{false};
};

} // namespace railseat::infra
