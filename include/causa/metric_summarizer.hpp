#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>

#include "causa/collaborators.hpp"

namespace causa {

// Builds the resource-usage block of the diagnostic context from the pod spec and
// a handful of Prometheus queries.
class MetricSummarizer {
public:
    MetricSummarizer(ClusterInfo* cluster, MetricsBackend* metrics);

    // Never throws: a failure anywhere returns a one-line error message instead
    // of the metrics block.
    QString summarize(const QString& nameSpace, const QString& target) const;

    // Latest sample of the first series in a query response; 0.0 for an empty
    // or unparseable response.
    static double extractValue(const QJsonObject& response);

    static QString memoryUsageQuery(const QString& nameSpace, const QString& target);
    static QString memoryLimitQuery(const QString& nameSpace, const QString& target);
    static QString cpuUsageQuery(const QString& nameSpace, const QString& target);
    static QString cpuLimitQuery(const QString& nameSpace, const QString& target);
    static QString jvmHeapQuery(const QString& nameSpace, const QString& target);

    // "{cpu=500m, memory=512Mi}"
    static QString formatResourceMap(const QMap<QString, QString>& values);

private:
    ClusterInfo* cluster_;
    MetricsBackend* metrics_;
};

}  // namespace causa
