#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace causa {

// Final artifact of one analysis run.
struct RcaReport {
    QString title;
    QString issue;
    QString evidence;
    QStringList supportedLogs;
    QString proposedSolution;
    std::optional<double> validationConfidence;

    // Lenient reader for validator output: missing keys stay empty, a single
    // string in supportedLogs becomes a one-entry list, and confidence given as a
    // number or numeric string is clamped into [0, 1].
    static RcaReport fromJson(const QJsonObject& object);
    [[nodiscard]] QJsonObject toJson() const;
};

}  // namespace causa
