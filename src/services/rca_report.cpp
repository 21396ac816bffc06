#include "causa/rca_report.hpp"

#include <QJsonArray>
#include <QJsonValue>

#include <algorithm>
#include <cmath>

namespace causa {

namespace {

QString textField(const QJsonObject& object, const QString& key) {
    const QJsonValue value = object.value(key);
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    return {};
}

std::optional<double> confidenceField(const QJsonValue& value) {
    double parsed = 0.0;
    if (value.isDouble()) {
        parsed = value.toDouble();
    } else if (value.isString()) {
        bool ok = false;
        parsed = value.toString().trimmed().toDouble(&ok);
        if (!ok) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(parsed)) {
        return std::nullopt;
    }
    return std::clamp(parsed, 0.0, 1.0);
}

}  // namespace

RcaReport RcaReport::fromJson(const QJsonObject& object) {
    RcaReport report;
    report.title = textField(object, "title");
    report.issue = textField(object, "issue");
    report.evidence = textField(object, "evidence");
    report.proposedSolution = textField(object, "proposedSolution");

    const QJsonValue logs = object.value("supportedLogs");
    if (logs.isArray()) {
        for (const QJsonValue& entry : logs.toArray()) {
            if (entry.isString() && !entry.toString().trimmed().isEmpty()) {
                report.supportedLogs.append(entry.toString());
            }
        }
    } else if (logs.isString() && !logs.toString().trimmed().isEmpty()) {
        report.supportedLogs.append(logs.toString());
    }

    report.validationConfidence = confidenceField(object.value("validationConfidence"));
    return report;
}

QJsonObject RcaReport::toJson() const {
    QJsonObject out;
    out.insert("title", title);
    out.insert("issue", issue);
    out.insert("evidence", evidence);
    out.insert("supportedLogs", QJsonArray::fromStringList(supportedLogs));
    out.insert("proposedSolution", proposedSolution);
    if (validationConfidence.has_value()) {
        out.insert("validationConfidence", *validationConfidence);
    } else {
        out.insert("validationConfidence", QJsonValue::Null);
    }
    return out;
}

}  // namespace causa
