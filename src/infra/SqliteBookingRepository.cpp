#include "infra/SqliteBookingRepository.hpp"

#include <QDebug>
#include <QStringList>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <utility>

namespace railseat::infra {

using railseat::app::Deadline;
using railseat::app::StoreStatus;
using railseat::domain::Booking;
using railseat::domain::BookingId;
using railseat::domain::BookingStatus;
using railseat::domain::TimePoint;
using railseat::domain::Train;
using railseat::domain::TrainId;
using railseat::domain::TravelDate;
using railseat::domain::User;
using railseat::domain::UserId;

namespace {

constexpr int kSchemaVersion = 1;

std::atomic<int>     gNextRepoSerial{1};
std::atomic<quint64> gNextThreadSerial{1};

// Stable per-thread number; unlike native thread ids it is never reused.
quint64 threadSerial() {
    thread_local const quint64 serial = gNextThreadSerial.fetch_add(1);
    return serial;
}

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

void setError(std::string* errorOut, const QString& message) {
    if (errorOut) {
        *errorOut = message.toStdString();
    }
}

// SQLITE_CONSTRAINT (19) and its extended codes (UNIQUE 2067, FOREIGNKEY 787, CHECK 275, ...).
bool isConstraintError(const QSqlError& e) {
    bool ok = false;
    const int code = e.nativeErrorCode().toInt(&ok);
    if (ok && (code & 0xff) == 19) {
        return true;
    }
    return e.text().contains(QStringLiteral("constraint failed"), Qt::CaseInsensitive);
}

// SQLITE_BUSY (5) and SQLITE_LOCKED (6), with extended codes.
bool isBusyError(const QSqlError& e) {
    bool ok = false;
    const int code = e.nativeErrorCode().toInt(&ok);
    if (ok && ((code & 0xff) == 5 || (code & 0xff) == 6)) {
        return true;
    }
    return e.text().contains(QStringLiteral("database is locked"), Qt::CaseInsensitive);
}

StoreStatus failWith(const QSqlQuery& q, const char* what, std::string* errorOut) {
    const QSqlError err = q.lastError();
    const bool constraint = isConstraintError(err);
    if (!constraint) {
        qWarning() << what << err.text();
    }
    setError(errorOut, QString::fromLatin1(what) + QStringLiteral(" ") + err.text());
    return constraint ? StoreStatus::ConstraintViolation : StoreStatus::Failed;
}

// Runs a prepared single-row lookup and leaves the query on that row.
StoreStatus readOne(QSqlQuery& q, const char* what, std::string* errorOut) {
    if (!q.exec()) {
        qWarning() << what << q.lastError().text();
        setError(errorOut, QString::fromLatin1(what) + QStringLiteral(" ") + q.lastError().text());
        return StoreStatus::Failed;
    }
    if (!q.next()) {
        if (q.lastError().type() != QSqlError::NoError) {
            qWarning() << what << q.lastError().text();
            setError(errorOut, QString::fromLatin1(what) + QStringLiteral(" ") + q.lastError().text());
            return StoreStatus::Failed;
        }
        setError(errorOut, QStringLiteral("no such row"));
        return StoreStatus::NotFound;
    }
    return StoreStatus::Ok;
}

void setBusyTimeout(const QSqlDatabase& db, qint64 ms) {
    QSqlQuery q(db);
    if (!q.exec(QStringLiteral("PRAGMA busy_timeout = %1").arg(ms))) {
        qWarning() << "Failed to set busy timeout:" << q.lastError().text();
    }
}

// Connections opened by the current thread. They are closed and removed when
// the thread exits, so short-lived caller threads do not leak SQLite handles.
class ThreadConnections {
public:
    ~ThreadConnections() {
        for (const auto& name : names_) {
            close(name);
        }
    }

    void adopt(const QString& name) { names_.append(name); }
    bool release(const QString& name) { return names_.removeAll(name) > 0; }

    static void close(const QString& name) {
        {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(name);
    }

private:
    QStringList names_;
};

ThreadConnections& threadConnections() {
    thread_local ThreadConnections owned;
    return owned;
}

bool execOrFail(QSqlQuery& q, const QString& sql, QString* err) {
    if (!q.exec(sql)) {
        if (err) *err = q.lastError().text() + " | SQL: " + sql;
        return false;
    }
    return true;
}

// Rolls back unless commit() succeeded, on every exit path.
class ScopedTransaction {
public:
    explicit ScopedTransaction(QSqlDatabase db)
        : db_(std::move(db)) {
    }

    ~ScopedTransaction() {
        if (active_) {
            rollback();
        }
    }

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    bool begin(QString* err, bool* busy) {
        QSqlQuery q(db_);
        if (!q.exec(QStringLiteral("BEGIN IMMEDIATE"))) {
            if (err) *err = q.lastError().text();
            if (busy) *busy = isBusyError(q.lastError());
            return false;
        }
        active_ = true;
        return true;
    }

    bool commit(QString* err) {
        QSqlQuery q(db_);
        if (!execOrFail(q, QStringLiteral("COMMIT"), err)) {
            return false; // destructor rolls back
        }
        active_ = false;
        return true;
    }

    void rollback() {
        active_ = false;
        QSqlQuery q(db_);
        if (!q.exec(QStringLiteral("ROLLBACK"))) {
            qWarning() << "Rollback failed:" << q.lastError().text();
        }
    }

private:
    QSqlDatabase db_;
    bool         active_{false};
};

User userFromRow(const QSqlQuery& q) {
    User u;
    u.id        = q.value(0).toLongLong();
    u.username  = q.value(1).toString().toStdString();
    u.email     = q.value(2).toString().toStdString();
    u.isAdmin   = q.value(3).toInt() != 0;
    u.createdAt = fromUnixMs(q.value(4).toLongLong());
    return u;
}

Train trainFromRow(const QSqlQuery& q) {
    Train t;
    t.id          = q.value(0).toLongLong();
    t.trainNumber = q.value(1).toString().toStdString();
    t.source      = q.value(2).toString().toStdString();
    t.destination = q.value(3).toString().toStdString();
    t.totalSeats  = q.value(4).toInt();
    t.createdAt   = fromUnixMs(q.value(5).toLongLong());
    return t;
}

constexpr auto kBookingColumns =
    "SELECT id, user_id, train_id, seat_number, booking_date, status,"
    " idempotency_token, created_at, cancelled_at FROM bookings";

Booking bookingFromRow(const QSqlQuery& q) {
    Booking b;
    b.id          = q.value(0).toLongLong();
    b.userId      = q.value(1).toLongLong();
    b.trainId     = q.value(2).toLongLong();
    b.seatNumber  = q.value(3).toInt();
    b.bookingDate = TravelDate{q.value(4).toInt()};
    b.status      = static_cast<BookingStatus>(q.value(5).toInt());

    if (!q.value(6).isNull()) {
        b.idempotencyToken = q.value(6).toString().toStdString();
    }

    b.createdAt = fromUnixMs(q.value(7).toLongLong());
    if (!q.value(8).isNull()) {
        b.cancelledAt = fromUnixMs(q.value(8).toLongLong());
    }
    return b;
}

} // namespace

SqliteBookingRepository::SqliteBookingRepository(const QString& dbPath, int busyTimeoutMs)
    : dbPath_(dbPath)
    , connPrefix_(QStringLiteral("railseat-%1-").arg(gNextRepoSerial.fetch_add(1)))
    , busyTimeoutMs_(busyTimeoutMs > 0 ? busyTimeoutMs : 5000) {
    const QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return;
    }

    QString err;
    if (!initSchema(&err)) {
        qWarning() << "Failed to initialise booking schema:" << err;
        return;
    }
    ready_ = true;
}

// Connections of other threads are closed when those threads exit.
SqliteBookingRepository::~SqliteBookingRepository() {
    const QString name = connectionName();
    if (threadConnections().release(name)) {
        ThreadConnections::close(name);
    }
}

QString SqliteBookingRepository::connectionName() const {
    return connPrefix_ + QString::number(threadSerial());
}

QSqlDatabase SqliteBookingRepository::connection() const {
    const QString name = connectionName();
    if (QSqlDatabase::contains(name)) {
        return QSqlDatabase::database(name);
    }

    QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
    db.setDatabaseName(dbPath_);
    db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(busyTimeoutMs_));
    threadConnections().adopt(name);

    if (!db.open()) {
        qWarning() << "Failed to open booking DB" << dbPath_ << ":" << db.lastError().text();
        return db;
    }

    QSqlQuery q(db);
    if (!q.exec(QStringLiteral("PRAGMA foreign_keys=ON;"))) {
        qWarning() << "Failed to enable foreign keys:" << q.lastError().text();
    }
    return db;
}

bool SqliteBookingRepository::initSchema(QString* errorOut) const {
    QSqlDatabase db = connection();
    QSqlQuery q(db);

    // WAL lets readers on other connections proceed while one writer commits.
    if (!execOrFail(q, "PRAGMA journal_mode=WAL;", errorOut)) return false;
    if (!execOrFail(q, "PRAGMA synchronous=NORMAL;", errorOut)) return false;

    if (!execOrFail(q, R"SQL(
        CREATE TABLE IF NOT EXISTS meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )SQL", errorOut)) return false;

    if (!execOrFail(q, R"SQL(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT NOT NULL UNIQUE,
            password_hash TEXT NOT NULL DEFAULT '',
            email TEXT NOT NULL UNIQUE,
            is_admin INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        );
    )SQL", errorOut)) return false;

    if (!execOrFail(q, R"SQL(
        CREATE TABLE IF NOT EXISTS trains (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            train_number TEXT NOT NULL UNIQUE,
            source TEXT NOT NULL,
            destination TEXT NOT NULL,
            total_seats INTEGER NOT NULL CHECK(total_seats > 0),
            created_at INTEGER NOT NULL
        );
    )SQL", errorOut)) return false;

    if (!execOrFail(q, R"SQL(
        CREATE TABLE IF NOT EXISTS bookings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL REFERENCES users(id),
            train_id INTEGER NOT NULL REFERENCES trains(id),
            seat_number INTEGER NOT NULL CHECK(seat_number >= 1),
            booking_date INTEGER NOT NULL,   -- travel date, YYYYMMDD
            status INTEGER NOT NULL DEFAULT 0, -- 0 active, 1 cancelled
            idempotency_token TEXT,
            created_at INTEGER NOT NULL,
            cancelled_at INTEGER
        );
    )SQL", errorOut)) return false;

    // One active booking per seat and travel date; cancelled rows do not block rebooking.
    if (!execOrFail(q, "CREATE UNIQUE INDEX IF NOT EXISTS ux_bookings_active_seat"
                       " ON bookings(train_id, seat_number, booking_date) WHERE status = 0;", errorOut)) return false;
    if (!execOrFail(q, "CREATE UNIQUE INDEX IF NOT EXISTS ux_bookings_token"
                       " ON bookings(idempotency_token) WHERE idempotency_token IS NOT NULL;", errorOut)) return false;
    if (!execOrFail(q, "CREATE INDEX IF NOT EXISTS idx_trains_route ON trains(source, destination);", errorOut)) return false;

    if (!execOrFail(q, QStringLiteral("INSERT OR REPLACE INTO meta(key, value) VALUES('schema_version', '%1');")
                           .arg(kSchemaVersion), errorOut)) return false;

    return true;
}

StoreStatus SqliteBookingRepository::addUser(User& user, std::string* errorOut) {
    QSqlQuery q(connection());
    q.prepare("INSERT INTO users (username, email, is_admin, created_at) VALUES (?, ?, ?, ?)");
    q.addBindValue(QString::fromStdString(user.username));
    q.addBindValue(QString::fromStdString(user.email));
    q.addBindValue(user.isAdmin ? 1 : 0);
    q.addBindValue(QVariant(toUnixMs(user.createdAt)));

    if (!q.exec()) {
        return failWith(q, "Failed to add user:", errorOut);
    }
    user.id = q.lastInsertId().toLongLong();
    return StoreStatus::Ok;
}

StoreStatus SqliteBookingRepository::addTrain(Train& train, std::string* errorOut) {
    QSqlQuery q(connection());
    q.prepare(
        "INSERT INTO trains (train_number, source, destination, total_seats, created_at)"
        " VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(QString::fromStdString(train.trainNumber));
    q.addBindValue(QString::fromStdString(train.source));
    q.addBindValue(QString::fromStdString(train.destination));
    q.addBindValue(train.totalSeats);
    q.addBindValue(QVariant(toUnixMs(train.createdAt)));

    if (!q.exec()) {
        return failWith(q, "Failed to add train:", errorOut);
    }
    train.id = q.lastInsertId().toLongLong();
    return StoreStatus::Ok;
}

StoreStatus SqliteBookingRepository::findUser(UserId id, User& out, std::string* errorOut) const {
    QSqlQuery q(connection());
    q.prepare("SELECT id, username, email, is_admin, created_at FROM users WHERE id = ?");
    q.addBindValue(QVariant(static_cast<qlonglong>(id)));

    const StoreStatus st = readOne(q, "Failed to read user:", errorOut);
    if (st == StoreStatus::Ok) {
        out = userFromRow(q);
    }
    return st;
}

StoreStatus SqliteBookingRepository::findTrain(TrainId id, Train& out, std::string* errorOut) const {
    QSqlQuery q(connection());
    q.prepare("SELECT id, train_number, source, destination, total_seats, created_at FROM trains WHERE id = ?");
    q.addBindValue(QVariant(static_cast<qlonglong>(id)));

    const StoreStatus st = readOne(q, "Failed to read train:", errorOut);
    if (st == StoreStatus::Ok) {
        out = trainFromRow(q);
    }
    return st;
}

StoreStatus SqliteBookingRepository::findTrainsByRoute(const std::string& source,
                                                       const std::string& destination,
                                                       std::vector<Train>& out,
                                                       std::string* errorOut) const {
    out.clear();

    QSqlQuery q(connection());
    q.prepare(
        "SELECT id, train_number, source, destination, total_seats, created_at FROM trains"
        " WHERE source = ? AND destination = ? ORDER BY id ASC");
    q.addBindValue(QString::fromStdString(source));
    q.addBindValue(QString::fromStdString(destination));

    if (!q.exec()) {
        return failWith(q, "Failed to read trains by route:", errorOut);
    }
    while (q.next()) {
        out.push_back(trainFromRow(q));
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteBookingRepository::withTransaction(const std::function<bool()>& fn,
                                                     std::string* errorOut,
                                                     Deadline deadline) {
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        setError(errorOut, QStringLiteral("database is not open"));
        return StoreStatus::Failed;
    }

    // Waiting for another writer must not outlast the caller's deadline.
    const bool bounded = deadline != Deadline::max();
    qint64 waitMs = busyTimeoutMs_;
    if (bounded) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            setError(errorOut, QStringLiteral("deadline passed before the transaction started"));
            return StoreStatus::Timeout;
        }
        waitMs = std::min<qint64>(left, busyTimeoutMs_);
        setBusyTimeout(db, waitMs);
    }

    ScopedTransaction tx(db);
    QString err;
    bool busy = false;
    const bool begun = tx.begin(&err, &busy);
    if (bounded) {
        setBusyTimeout(db, busyTimeoutMs_);
    }
    if (!begun) {
        setError(errorOut, err);
        if (busy && bounded && waitMs < busyTimeoutMs_) {
            qDebug() << "Store stayed busy for" << waitMs << "ms, giving up at the caller's deadline";
            return StoreStatus::Timeout;
        }
        qWarning() << "Failed to begin transaction:" << err;
        return StoreStatus::Failed;
    }

    if (!fn()) {
        tx.rollback();
        return StoreStatus::RolledBack;
    }

    if (!tx.commit(&err)) {
        qWarning() << "Failed to commit transaction:" << err;
        setError(errorOut, err);
        return StoreStatus::Failed;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteBookingRepository::insertBooking(Booking& booking, std::string* errorOut) {
    QSqlQuery q(connection());
    q.prepare(
        "INSERT INTO bookings"
        " (user_id, train_id, seat_number, booking_date, status, idempotency_token, created_at, cancelled_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?)");

    q.addBindValue(QVariant(static_cast<qlonglong>(booking.userId)));
    q.addBindValue(QVariant(static_cast<qlonglong>(booking.trainId)));
    q.addBindValue(booking.seatNumber);
    q.addBindValue(booking.bookingDate.ymd);
    q.addBindValue(static_cast<int>(booking.status));

    if (booking.idempotencyToken) {
        q.addBindValue(QString::fromStdString(*booking.idempotencyToken));
    } else {
        q.addBindValue(QVariant());
    }

    q.addBindValue(QVariant(toUnixMs(booking.createdAt)));
    if (booking.cancelledAt) {
        q.addBindValue(QVariant(toUnixMs(*booking.cancelledAt)));
    } else {
        q.addBindValue(QVariant());
    }

    if (!q.exec()) {
        return failWith(q, "Failed to insert booking:", errorOut);
    }
    booking.id = q.lastInsertId().toLongLong();
    return StoreStatus::Ok;
}

StoreStatus SqliteBookingRepository::findBooking(BookingId id, Booking& out, std::string* errorOut) const {
    QSqlQuery q(connection());
    q.prepare(QString::fromLatin1(kBookingColumns) + " WHERE id = ?");
    q.addBindValue(QVariant(static_cast<qlonglong>(id)));

    const StoreStatus st = readOne(q, "Failed to read booking:", errorOut);
    if (st == StoreStatus::Ok) {
        out = bookingFromRow(q);
    }
    return st;
}

StoreStatus SqliteBookingRepository::findBookingByToken(const std::string& token,
                                                        Booking& out,
                                                        std::string* errorOut) const {
    QSqlQuery q(connection());
    q.prepare(QString::fromLatin1(kBookingColumns) + " WHERE idempotency_token = ?");
    q.addBindValue(QString::fromStdString(token));

    const StoreStatus st = readOne(q, "Failed to read booking by token:", errorOut);
    if (st == StoreStatus::Ok) {
        out = bookingFromRow(q);
    }
    return st;
}

StoreStatus SqliteBookingRepository::markCancelled(BookingId id, TimePoint at, std::string* errorOut) {
    QSqlQuery q(connection());
    q.prepare("UPDATE bookings SET status = ?, cancelled_at = ? WHERE id = ? AND status = ?");
    q.addBindValue(static_cast<int>(BookingStatus::Cancelled));
    q.addBindValue(QVariant(toUnixMs(at)));
    q.addBindValue(QVariant(static_cast<qlonglong>(id)));
    q.addBindValue(static_cast<int>(BookingStatus::Active));

    if (!q.exec()) {
        return failWith(q, "Failed to cancel booking:", errorOut);
    }
    if (q.numRowsAffected() == 0) {
        setError(errorOut, QStringLiteral("no active booking %1").arg(id));
        return StoreStatus::NotFound;
    }
    return StoreStatus::Ok;
}

std::optional<int> SqliteBookingRepository::countActiveBookings(TrainId trainId, TravelDate date) const {
    QSqlQuery q(connection());
    q.prepare("SELECT COUNT(*) FROM bookings WHERE train_id = ? AND booking_date = ? AND status = ?");
    q.addBindValue(QVariant(static_cast<qlonglong>(trainId)));
    q.addBindValue(date.ymd);
    q.addBindValue(static_cast<int>(BookingStatus::Active));

    if (!q.exec() || !q.next()) {
        qWarning() << "Failed to count bookings:" << q.lastError().text();
        return std::nullopt;
    }
    return q.value(0).toInt();
}

StoreStatus SqliteBookingRepository::activeSeats(TrainId trainId,
                                                 TravelDate date,
                                                 std::vector<int>& out,
                                                 std::string* errorOut) const {
    out.clear();

    QSqlQuery q(connection());
    q.prepare(
        "SELECT seat_number FROM bookings"
        " WHERE train_id = ? AND booking_date = ? AND status = ? ORDER BY seat_number ASC");
    q.addBindValue(QVariant(static_cast<qlonglong>(trainId)));
    q.addBindValue(date.ymd);
    q.addBindValue(static_cast<int>(BookingStatus::Active));

    if (!q.exec()) {
        return failWith(q, "Failed to read active seats:", errorOut);
    }
    while (q.next()) {
        out.push_back(q.value(0).toInt());
    }
    return StoreStatus::Ok;
}

} // namespace railseat::infra
