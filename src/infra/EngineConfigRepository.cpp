#include "infra/EngineConfigRepository.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <utility>

namespace railseat::infra {

using railseat::domain::EngineConfig;

namespace {

int positiveOr(const QJsonObject& o, const QString& key, int fallback) {
    if (!o.contains(key)) {
        return fallback;
    }
    const int v = o.value(key).toInt(0);
    if (v <= 0) {
        qWarning() << "Invalid value for" << key << "in engine config, using default" << fallback;
        return fallback;
    }
    return v;
}

} // namespace

EngineConfigRepository::EngineConfigRepository(std::string path)
    : path_(std::move(path)) {
}

EngineConfig EngineConfigRepository::load() const {
    const EngineConfig defaults;

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Engine config not found, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open engine config, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid engine config, using defaults:" << parseErr.errorString();
        return defaults;
    }

    const auto o = doc.object();

    EngineConfig cfg;
    const auto dbPath = o.value(QStringLiteral("database_path")).toString();
    if (!dbPath.isEmpty()) {
        cfg.databasePath = dbPath.toStdString();
    }

    cfg.maxAssignAttempts   = positiveOr(o, QStringLiteral("max_assign_attempts"), defaults.maxAssignAttempts);
    cfg.defaultTimeoutMs    = positiveOr(o, QStringLiteral("default_timeout_ms"), defaults.defaultTimeoutMs);
    cfg.busyTimeoutMs       = positiveOr(o, QStringLiteral("busy_timeout_ms"), defaults.busyTimeoutMs);
    cfg.allowSameDayBooking = o.value(QStringLiteral("allow_same_day_booking")).toBool(defaults.allowSameDayBooking);

    return cfg;
}

bool EngineConfigRepository::save(const EngineConfig& config) const {
    QJsonObject root;
    root.insert(QStringLiteral("database_path"),          QString::fromStdString(config.databasePath));
    root.insert(QStringLiteral("max_assign_attempts"),    config.maxAssignAttempts);
    root.insert(QStringLiteral("default_timeout_ms"),     config.defaultTimeoutMs);
    root.insert(QStringLiteral("busy_timeout_ms"),        config.busyTimeoutMs);
    root.insert(QStringLiteral("allow_same_day_booking"), config.allowSameDayBooking);

    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write engine config:" << QString::fromStdString(path_);
        return false;
    }

    QJsonDocument doc(root);
    const auto bytes = doc.toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        qWarning() << "Short write to engine config:" << file.errorString();
        return false;
    }
    file.close();
    return true;
}

} // namespace railseat::infra
