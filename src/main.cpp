#include <QCoreApplication>
#include <QDebug>
#include <QString>

#include <exception>
#include <iostream>
#include <sstream>
#include <string>

#include "app/ConflictResolver.hpp"
#include "app/ReservationEngine.hpp"
#include "app/SeatLedger.hpp"
#include "infra/DateFormat.hpp"
#include "infra/EngineConfigRepository.hpp"
#include "infra/SqliteBookingRepository.hpp"
#include "infra/SystemClock.hpp"

using namespace railseat;

namespace {

void printHelp() {
    std::cout
        << "Commands:\n"
        << "  add-user <username> <email> [admin]\n"
        << "  add-train <number> <source> <destination> <seats>\n"
        << "  trains <source> <destination> <yyyy-MM-dd>\n"
        << "  seats <train_id> <yyyy-MM-dd>\n"
        << "  book <user_id> <train_id> <yyyy-MM-dd> <seat|any> [token]\n"
        << "  cancel <booking_id> <requester_id>\n"
        << "  show <booking_id> <requester_id>\n"
        << "  exit\n";
}

bool readDate(std::istringstream& iss, domain::TravelDate& out) {
    std::string text;
    iss >> text;
    const auto parsed = infra::fmt::parseIsoDate(QString::fromStdString(text));
    if (!parsed) {
        std::cout << "FAIL: expected a date as yyyy-MM-dd, got '" << text << "'\n";
        return false;
    }
    out = *parsed;
    return true;
}

void printBooking(const domain::Booking& b) {
    std::cout << "booking " << b.id
              << " user=" << b.userId
              << " train=" << b.trainId
              << " seat=" << b.seatNumber
              << " date=" << domain::to_string(b.bookingDate)
              << " status=" << domain::to_string(b.status)
              << " created=" << infra::fmt::formatLocalIso(b.createdAt).toStdString();
    if (b.cancelledAt) {
        std::cout << " cancelled=" << infra::fmt::formatLocalIso(*b.cancelledAt).toStdString();
    }
    std::cout << "\n";
}

void printError(const domain::BookingError& e) {
    std::cout << "FAIL: " << domain::describe(e) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication qapp(argc, argv);

    const QString appDir = QCoreApplication::applicationDirPath();
    const QString configPath = argc > 1 ? QString::fromLocal8Bit(argv[1]) : appDir + "/railseat.json";
    qDebug() << "Engine config path:" << configPath;

    infra::EngineConfigRepository configRepo(configPath.toStdString());
    const domain::EngineConfig config = configRepo.load();

    const QString dbPath = QString::fromStdString(config.databasePath);
    qDebug() << "Booking DB path:" << dbPath;

    infra::SqliteBookingRepository repo(dbPath, config.busyTimeoutMs);
    if (!repo.isReady()) {
        std::cerr << "Cannot open booking database: " << dbPath.toStdString() << "\n";
        return 1;
    }

    app::SeatLedger ledger(repo);
    app::ConflictResolver resolver(config.maxAssignAttempts);
    infra::SystemClock clock;
    app::ReservationEngine engine(repo, ledger, resolver, clock, config);

    std::cout << "RailSeat booking CLI\n";
    printHelp();

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) break;
        if (line == "exit") break;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help") {
            printHelp();
        } else if (cmd == "add-user") {
            domain::User user;
            std::string adminFlag;
            iss >> user.username >> user.email >> adminFlag;
            user.isAdmin = (adminFlag == "admin");
            std::string err;
            const auto st = repo.addUser(user, &err);
            if (st == app::StoreStatus::Ok) {
                std::cout << "OK: user " << user.id << (user.isAdmin ? " (admin)" : "") << "\n";
            } else {
                std::cout << "FAIL: " << app::to_string(st) << ": " << err << "\n";
            }
        } else if (cmd == "add-train") {
            domain::Train train;
            iss >> train.trainNumber >> train.source >> train.destination >> train.totalSeats;
            std::string err;
            const auto st = repo.addTrain(train, &err);
            if (st == app::StoreStatus::Ok) {
                std::cout << "OK: train " << train.id << " (" << train.totalSeats << " seats)\n";
            } else {
                std::cout << "FAIL: " << app::to_string(st) << ": " << err << "\n";
            }
        } else if (cmd == "trains") {
            std::string source, destination;
            domain::TravelDate date;
            iss >> source >> destination;
            if (!readDate(iss, date)) continue;

            const auto r = engine.routeAvailability(source, destination, date);
            if (!r.ok()) {
                printError(*r.error);
                continue;
            }
            if (r.trains.empty()) {
                std::cout << "No trains from " << source << " to " << destination << "\n";
            }
            for (const auto& a : r.trains) {
                std::cout << a.train.id << ": " << a.train.trainNumber << " "
                          << a.freeSeats << "/" << a.train.totalSeats << " free\n";
            }
        } else if (cmd == "seats") {
            domain::TrainId trainId = 0;
            domain::TravelDate date;
            iss >> trainId;
            if (!readDate(iss, date)) continue;

            const auto r = engine.availability(trainId, date);
            if (!r.ok()) {
                printError(*r.error);
                continue;
            }
            std::cout << "Available seats (" << r.seats.size() << "): ";
            for (std::size_t i = 0; i < r.seats.size(); ++i) {
                std::cout << r.seats[i] << (i + 1 < r.seats.size() ? ", " : "");
            }
            std::cout << "\n";
        } else if (cmd == "book") {
            app::BookingRequest req;
            std::string seatText, token;
            iss >> req.userId >> req.trainId;
            if (!readDate(iss, req.date)) continue;
            iss >> seatText >> token;

            if (seatText == "any") {
                req.seat = domain::SeatPreference::any();
            } else {
                try {
                    req.seat = domain::SeatPreference::exact(std::stoi(seatText));
                } catch (const std::exception&) {
                    std::cout << "FAIL: seat must be a number or 'any'\n";
                    continue;
                }
            }
            if (!token.empty()) {
                req.idempotencyToken = token;
            }

            const auto r = engine.book(req);
            if (r.ok()) {
                std::cout << (r.replayed ? "OK (replayed): " : "OK: ");
                printBooking(*r.booking);
            } else {
                printError(*r.error);
            }
        } else if (cmd == "cancel") {
            domain::BookingId bookingId = 0;
            domain::UserId requester = 0;
            iss >> bookingId >> requester;
            const auto r = engine.cancel(bookingId, requester);
            if (r.ok()) {
                std::cout << "OK: booking " << bookingId << " cancelled\n";
            } else {
                printError(*r.error);
            }
        } else if (cmd == "show") {
            domain::BookingId bookingId = 0;
            domain::UserId requester = 0;
            iss >> bookingId >> requester;
            const auto r = engine.bookingDetails(bookingId, requester);
            if (!r.ok()) {
                printError(*r.error);
                continue;
            }
            std::cout << "OK: " << r.details->trainNumber << " "
                      << r.details->source << " -> " << r.details->destination << "\n";
            printBooking(r.details->booking);
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }

    return 0;
}
