#include "causa/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>

namespace causa {

Telemetry& Telemetry::instance() {
    static Telemetry singleton;
    return singleton;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    const qint64 prev = static_cast<qint64>(counters_.value(key).toDouble(0));
    counters_.insert(key, static_cast<double>(prev + delta));
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    const QJsonObject old = durations_.value(key).toObject();
    const qint64 count = static_cast<qint64>(old.value("count").toDouble(0)) + 1;
    const qint64 total = static_cast<qint64>(old.value("total_ms").toDouble(0)) + durationMs;
    const qint64 max = qMax(static_cast<qint64>(old.value("max_ms").toDouble(0)), durationMs);
    durations_.insert(key, QJsonObject{
        {"count", static_cast<double>(count)},
        {"total_ms", static_cast<double>(total)},
        {"max_ms", static_cast<double>(max)},
        {"avg_ms", static_cast<double>(total) / static_cast<double>(count)},
    });
}

void Telemetry::trimEventsLocked() {
    while (events_.size() > maxEvents_) {
        events_.removeFirst();
    }
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    events_.append(row);
    trimEventsLocked();
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return static_cast<qint64>(counters_.value(key).toDouble(0));
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    return {
        {"counters", counters_},
        {"durations", durations_},
        {"events", events_},
        {"timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate)},
    };
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QJsonObject payload = snapshot();

    QFile file(filePath);
    const QDir dir = QFileInfo(file).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return {
            {"success", false},
            {"error", "Failed to create telemetry export directory."},
            {"path", filePath},
        };
    }

    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", "Failed to open telemetry export path."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(payload).toJson(QJsonDocument::Indented));
    file.close();
    return {
        {"success", true},
        {"path", filePath},
    };
}

}  // namespace causa
