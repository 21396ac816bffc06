#pragma once

#include <QJsonObject>
#include <QPair>
#include <QString>

#include <functional>

#include "causa/collaborators.hpp"
#include "causa/rca_report.hpp"

namespace causa {

class DiagnosticPipeline;

// Runs the pipeline over every pod carrying a label. One pod's failure is
// recorded and the scan moves on.
class WorkloadScanner {
public:
    using ReportCallback = std::function<void(const PodRef&, const RcaReport&)>;

    WorkloadScanner(ClusterInfo* cluster, const DiagnosticPipeline* pipeline);

    QJsonObject scan(const QString& label, const ReportCallback& onReport = {}) const;

    // "key=value" -> (key, value); a bare "key" gives an empty value.
    static QPair<QString, QString> parseLabel(const QString& label);

private:
    ClusterInfo* cluster_;
    const DiagnosticPipeline* pipeline_;
};

}  // namespace causa
