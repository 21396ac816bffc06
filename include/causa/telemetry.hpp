#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace causa {

// Process-wide counters, duration stats and a bounded event log.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;

private:
    Telemetry() = default;

    void trimEventsLocked();

    mutable QMutex mutex_;
    QJsonObject counters_;
    QJsonObject durations_;
    QJsonArray events_;

    int maxEvents_ = 500;
};

}  // namespace causa
