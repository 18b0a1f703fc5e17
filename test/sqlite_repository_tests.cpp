#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <QtSql/QSqlDatabase>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/ConflictResolver.hpp"
#include "app/ReservationEngine.hpp"
#include "app/SeatLedger.hpp"
#include "infra/SqliteBookingRepository.hpp"
#include "support/FixedClock.hpp"

using railseat::app::BookingRequest;
using railseat::app::ConflictResolver;
using railseat::app::ReservationEngine;
using railseat::app::SeatLedger;
using railseat::app::StoreStatus;
using railseat::domain::Booking;
using railseat::domain::BookingStatus;
using railseat::domain::Clock;
using railseat::domain::ErrorKind;
using railseat::domain::SeatPreference;
using railseat::domain::Train;
using railseat::domain::TrainId;
using railseat::domain::TravelDate;
using railseat::domain::User;
using railseat::domain::UserId;
using railseat::domain::makeDate;
using railseat::infra::SqliteBookingRepository;
using railseat::test::FixedClock;

namespace {

const TravelDate kDay   = makeDate(2026, 11, 14);
const TravelDate kOther = makeDate(2026, 11, 15);

} // namespace

class SqliteBookingRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        repo = open();
        ASSERT_TRUE(repo->isReady());
    }

    std::unique_ptr<SqliteBookingRepository> open() const {
        return std::make_unique<SqliteBookingRepository>(dir.filePath("bookings.sqlite"), 2000);
    }

    UserId addUser(const std::string& name, bool admin = false) {
        User u;
        u.username = name;
        u.email    = name + "@example.com";
        u.isAdmin  = admin;
        EXPECT_EQ(repo->addUser(u, nullptr), StoreStatus::Ok);
        return u.id;
    }

    TrainId addTrain(const std::string& number, int seats,
                     const std::string& source = "Pune", const std::string& destination = "Mumbai") {
        Train t;
        t.trainNumber = number;
        t.source      = source;
        t.destination = destination;
        t.totalSeats  = seats;
        EXPECT_EQ(repo->addTrain(t, nullptr), StoreStatus::Ok);
        return t.id;
    }

    Booking makeBooking(UserId user, TrainId train, int seat, TravelDate date = kDay) const {
        Booking b;
        b.userId      = user;
        b.trainId     = train;
        b.seatNumber  = seat;
        b.bookingDate = date;
        b.createdAt   = Clock::now();
        return b;
    }

    QTemporaryDir                            dir;
    std::unique_ptr<SqliteBookingRepository> repo;
};

TEST_F(SqliteBookingRepositoryTest, CatalogRoundTrip) {
    const auto admin = addUser("root", true);
    const auto train = addTrain("12127", 40);

    User u;
    ASSERT_EQ(repo->findUser(admin, u, nullptr), StoreStatus::Ok);
    EXPECT_EQ(u.username, "root");
    EXPECT_TRUE(u.isAdmin);

    Train t;
    ASSERT_EQ(repo->findTrain(train, t, nullptr), StoreStatus::Ok);
    EXPECT_EQ(t.trainNumber, "12127");
    EXPECT_EQ(t.totalSeats, 40);

    User missingUser;
    Train missingTrain;
    EXPECT_EQ(repo->findUser(admin + 100, missingUser, nullptr), StoreStatus::NotFound);
    EXPECT_EQ(repo->findTrain(train + 100, missingTrain, nullptr), StoreStatus::NotFound);
}

TEST_F(SqliteBookingRepositoryTest, DuplicateCatalogEntriesAreConstraintViolations) {
    addUser("alice");
    User dup;
    dup.username = "alice";
    dup.email    = "other@example.com";
    std::string err;
    EXPECT_EQ(repo->addUser(dup, &err), StoreStatus::ConstraintViolation);
    EXPECT_FALSE(err.empty());

    addTrain("12127", 10);
    Train again;
    again.trainNumber = "12127";
    again.source      = "A";
    again.destination = "B";
    again.totalSeats  = 5;
    EXPECT_EQ(repo->addTrain(again, nullptr), StoreStatus::ConstraintViolation);
}

TEST_F(SqliteBookingRepositoryTest, TrainNeedsPositiveCapacity) {
    Train t;
    t.trainNumber = "0000";
    t.source      = "A";
    t.destination = "B";
    t.totalSeats  = 0;
    EXPECT_EQ(repo->addTrain(t, nullptr), StoreStatus::ConstraintViolation);
}

TEST_F(SqliteBookingRepositoryTest, InsertAndFindBooking) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    Booking b = makeBooking(user, train, 3);
    b.idempotencyToken = "tok-1";
    ASSERT_EQ(repo->insertBooking(b, nullptr), StoreStatus::Ok);
    EXPECT_GT(b.id, 0);

    Booking byId;
    ASSERT_EQ(repo->findBooking(b.id, byId, nullptr), StoreStatus::Ok);
    EXPECT_EQ(byId.seatNumber, 3);
    EXPECT_EQ(byId.bookingDate, kDay);
    EXPECT_EQ(byId.status, BookingStatus::Active);
    EXPECT_FALSE(byId.cancelledAt.has_value());

    Booking byToken;
    ASSERT_EQ(repo->findBookingByToken("tok-1", byToken, nullptr), StoreStatus::Ok);
    EXPECT_EQ(byToken.id, b.id);
    Booking none;
    EXPECT_EQ(repo->findBookingByToken("tok-2", none, nullptr), StoreStatus::NotFound);
}

TEST_F(SqliteBookingRepositoryTest, ActiveSeatIsUniquePerDate) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    Booking first = makeBooking(user, train, 5);
    ASSERT_EQ(repo->insertBooking(first, nullptr), StoreStatus::Ok);

    Booking clash = makeBooking(user, train, 5);
    std::string err;
    EXPECT_EQ(repo->insertBooking(clash, &err), StoreStatus::ConstraintViolation);

    Booking otherDay = makeBooking(user, train, 5, kOther);
    EXPECT_EQ(repo->insertBooking(otherDay, nullptr), StoreStatus::Ok);
}

TEST_F(SqliteBookingRepositoryTest, CancelledRowFreesTheSeat) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    Booking b = makeBooking(user, train, 2);
    ASSERT_EQ(repo->insertBooking(b, nullptr), StoreStatus::Ok);
    ASSERT_EQ(repo->markCancelled(b.id, Clock::now(), nullptr), StoreStatus::Ok);

    Booking cancelled;
    ASSERT_EQ(repo->findBooking(b.id, cancelled, nullptr), StoreStatus::Ok);
    EXPECT_EQ(cancelled.status, BookingStatus::Cancelled);
    EXPECT_TRUE(cancelled.cancelledAt.has_value());

    EXPECT_EQ(repo->markCancelled(b.id, Clock::now(), nullptr), StoreStatus::NotFound);

    Booking rebook = makeBooking(user, train, 2);
    EXPECT_EQ(repo->insertBooking(rebook, nullptr), StoreStatus::Ok);
}

TEST_F(SqliteBookingRepositoryTest, TokenIsUnique) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    Booking a = makeBooking(user, train, 1);
    a.idempotencyToken = "same";
    ASSERT_EQ(repo->insertBooking(a, nullptr), StoreStatus::Ok);

    Booking b = makeBooking(user, train, 2);
    b.idempotencyToken = "same";
    EXPECT_EQ(repo->insertBooking(b, nullptr), StoreStatus::ConstraintViolation);
}

TEST_F(SqliteBookingRepositoryTest, UnknownForeignKeysAreRejected) {
    Booking orphan = makeBooking(999, 999, 1);
    EXPECT_EQ(repo->insertBooking(orphan, nullptr), StoreStatus::ConstraintViolation);
}

TEST_F(SqliteBookingRepositoryTest, TransactionCommitsAndRollsBack) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    Booking kept = makeBooking(user, train, 1);
    EXPECT_EQ(repo->withTransaction([&] { return repo->insertBooking(kept, nullptr) == StoreStatus::Ok; }, nullptr),
              StoreStatus::Ok);

    Booking dropped = makeBooking(user, train, 2);
    EXPECT_EQ(repo->withTransaction([&] {
                  EXPECT_EQ(repo->insertBooking(dropped, nullptr), StoreStatus::Ok);
                  return false;
              }, nullptr),
              StoreStatus::RolledBack);

    std::vector<int> seats;
    ASSERT_EQ(repo->activeSeats(train, kDay, seats, nullptr), StoreStatus::Ok);
    EXPECT_EQ(seats, (std::vector<int>{1}));
    Booking gone;
    EXPECT_EQ(repo->findBooking(dropped.id, gone, nullptr), StoreStatus::NotFound);
}

TEST_F(SqliteBookingRepositoryTest, ThrowingTransactionRollsBack) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    EXPECT_THROW(repo->withTransaction([&]() -> bool {
                     Booking b = makeBooking(user, train, 4);
                     EXPECT_EQ(repo->insertBooking(b, nullptr), StoreStatus::Ok);
                     throw std::runtime_error("boom");
                 }, nullptr),
                 std::runtime_error);

    EXPECT_EQ(repo->countActiveBookings(train, kDay), 0);

    // The connection is usable for the next transaction.
    Booking next = makeBooking(user, train, 4);
    EXPECT_EQ(repo->withTransaction([&] { return repo->insertBooking(next, nullptr) == StoreStatus::Ok; }, nullptr),
              StoreStatus::Ok);
}

TEST_F(SqliteBookingRepositoryTest, CountsAndListsActiveSeats) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    for (int seat : {7, 2, 9}) {
        Booking b = makeBooking(user, train, seat);
        ASSERT_EQ(repo->insertBooking(b, nullptr), StoreStatus::Ok);
    }
    Booking gone = makeBooking(user, train, 4);
    ASSERT_EQ(repo->insertBooking(gone, nullptr), StoreStatus::Ok);
    ASSERT_EQ(repo->markCancelled(gone.id, Clock::now(), nullptr), StoreStatus::Ok);

    EXPECT_EQ(repo->countActiveBookings(train, kDay), 3);
    EXPECT_EQ(repo->countActiveBookings(train, kOther), 0);

    std::vector<int> seats{42};
    ASSERT_EQ(repo->activeSeats(train, kDay, seats, nullptr), StoreStatus::Ok);
    EXPECT_EQ(seats, (std::vector<int>{2, 7, 9}));
}

TEST_F(SqliteBookingRepositoryTest, FindsTrainsByRoute) {
    const auto a = addTrain("11001", 10, "Delhi", "Agra");
    addTrain("11002", 10, "Agra", "Delhi");
    const auto c = addTrain("11003", 20, "Delhi", "Agra");

    std::vector<Train> trains;
    ASSERT_EQ(repo->findTrainsByRoute("Delhi", "Agra", trains, nullptr), StoreStatus::Ok);
    ASSERT_EQ(trains.size(), 2u);
    EXPECT_EQ(trains[0].id, a);
    EXPECT_EQ(trains[1].id, c);
    ASSERT_EQ(repo->findTrainsByRoute("Delhi", "Jaipur", trains, nullptr), StoreStatus::Ok);
    EXPECT_TRUE(trains.empty());
}

TEST_F(SqliteBookingRepositoryTest, DataSurvivesReopen) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);
    Booking b = makeBooking(user, train, 6);
    ASSERT_EQ(repo->insertBooking(b, nullptr), StoreStatus::Ok);

    repo.reset();
    repo = open();
    ASSERT_TRUE(repo->isReady());

    Booking again;
    ASSERT_EQ(repo->findBooking(b.id, again, nullptr), StoreStatus::Ok);
    EXPECT_EQ(again.seatNumber, 6);
}

TEST_F(SqliteBookingRepositoryTest, UnopenableDatabaseIsNotReady) {
    SqliteBookingRepository broken(dir.filePath("missing/dir/bookings.sqlite"));
    EXPECT_FALSE(broken.isReady());
}

TEST_F(SqliteBookingRepositoryTest, ReadsOnAClosedStoreFail) {
    SqliteBookingRepository broken(dir.filePath("missing/dir/bookings.sqlite"));
    ASSERT_FALSE(broken.isReady());

    std::string err;
    User u;
    EXPECT_EQ(broken.findUser(1, u, &err), StoreStatus::Failed);
    EXPECT_FALSE(err.empty());
    Booking b;
    EXPECT_EQ(broken.findBooking(1, b, nullptr), StoreStatus::Failed);
    std::vector<Train> trains;
    EXPECT_EQ(broken.findTrainsByRoute("Delhi", "Agra", trains, nullptr), StoreStatus::Failed);
}

TEST_F(SqliteBookingRepositoryTest, BusyStoreGivesUpAtTheCallersDeadline) {
    const auto user  = addUser("alice");
    const auto train = addTrain("12127", 10);

    // A second instance opens its own connection to the same file.
    auto other = open();
    ASSERT_TRUE(other->isReady());

    StoreStatus waited = StoreStatus::Ok;
    std::string err;
    std::chrono::milliseconds elapsed{0};
    ASSERT_EQ(repo->withTransaction([&] {
                  Booking held = makeBooking(user, train, 1);
                  EXPECT_EQ(repo->insertBooking(held, nullptr), StoreStatus::Ok);

                  const auto started = std::chrono::steady_clock::now();
                  waited = other->withTransaction([] { return true; }, &err,
                                                  started + std::chrono::milliseconds(50));
                  elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - started);
                  return true;
              }, nullptr),
              StoreStatus::Ok);

    EXPECT_EQ(waited, StoreStatus::Timeout);
    EXPECT_FALSE(err.empty());
    EXPECT_LT(elapsed.count(), 1500); // well under the 2000 ms busy timeout

    // The deadline only bounded that call; the next one waits as configured.
    EXPECT_EQ(other->withTransaction([] { return true; }, nullptr), StoreStatus::Ok);

    const auto past = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    EXPECT_EQ(other->withTransaction([] { return true; }, nullptr, past), StoreStatus::Timeout);
}

TEST_F(SqliteBookingRepositoryTest, ConnectionsOfFinishedThreadsAreClosed) {
    const auto train = addTrain("12127", 10);
    const int before = QSqlDatabase::connectionNames().size();

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] {
            Train t;
            EXPECT_EQ(repo->findTrain(train, t, nullptr), StoreStatus::Ok);
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(QSqlDatabase::connectionNames().size(), before);

    // The owning thread's connection goes with the repository.
    auto extra = open();
    ASSERT_TRUE(extra->isReady());
    EXPECT_EQ(QSqlDatabase::connectionNames().size(), before + 1);
    extra.reset();
    EXPECT_EQ(QSqlDatabase::connectionNames().size(), before);
}

// ---------- engine over SQLite ----------

TEST_F(SqliteBookingRepositoryTest, EngineBooksCancelsAndRehydrates) {
    const auto alice = addUser("alice");
    const auto train = addTrain("12127", 3);

    FixedClock       clock(makeDate(2026, 10, 18));
    ConflictResolver resolver;
    SeatLedger       ledger(*repo);
    ReservationEngine engine(*repo, ledger, resolver, clock);

    BookingRequest req;
    req.userId  = alice;
    req.trainId = train;
    req.date    = kDay;
    req.seat    = SeatPreference::any();

    const auto first = engine.book(req);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.booking->seatNumber, 1);

    req.seat = SeatPreference::exact(3);
    const auto second = engine.book(req);
    ASSERT_TRUE(second.ok());

    req.seat = SeatPreference::exact(1);
    const auto clash = engine.book(req);
    ASSERT_FALSE(clash.ok());
    EXPECT_EQ(clash.error->kind, ErrorKind::SeatTaken);

    ASSERT_TRUE(engine.cancel(first.booking->id, alice).ok());

    // A new ledger sees only the rows still active.
    SeatLedger fresh(*repo);
    ReservationEngine restarted(*repo, fresh, resolver, clock);
    const auto seats = restarted.availability(train, kDay);
    ASSERT_TRUE(seats.ok());
    EXPECT_EQ(seats.seats, (std::vector<int>{1, 2}));

    const auto rebook = restarted.book(req);
    ASSERT_TRUE(rebook.ok());
    EXPECT_EQ(rebook.booking->seatNumber, 1);
}

TEST_F(SqliteBookingRepositoryTest, EngineTimesOutBehindAnotherWriter) {
    const auto alice = addUser("alice");
    const auto train = addTrain("12127", 3);

    auto other = open();
    ASSERT_TRUE(other->isReady());

    FixedClock       clock(makeDate(2026, 10, 18));
    ConflictResolver resolver;
    SeatLedger       ledger(*other);
    ReservationEngine engine(*other, ledger, resolver, clock);

    BookingRequest req;
    req.userId  = alice;
    req.trainId = train;
    req.date    = kDay;
    req.seat    = SeatPreference::exact(2);
    req.timeout = std::chrono::milliseconds(60);

    railseat::domain::BookingResult r;
    std::chrono::milliseconds elapsed{0};
    ASSERT_EQ(repo->withTransaction([&] {
                  const auto started = std::chrono::steady_clock::now();
                  r = engine.book(req);
                  elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - started);
                  return true;
              }, nullptr),
              StoreStatus::Ok);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::Timeout);
    EXPECT_LT(elapsed.count(), 1500);
    EXPECT_EQ(ledger.claimedCount(train, kDay), 0);

    req.timeout.reset();
    EXPECT_TRUE(engine.book(req).ok());
}
