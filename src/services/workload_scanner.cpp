#include "causa/workload_scanner.hpp"

#include <QJsonArray>
#include <QVector>

#include <exception>

#include "causa/diagnostic_pipeline.hpp"
#include "causa/logging.hpp"
#include "causa/telemetry.hpp"

namespace causa {

WorkloadScanner::WorkloadScanner(ClusterInfo* cluster, const DiagnosticPipeline* pipeline)
    : cluster_(cluster),
      pipeline_(pipeline) {}

QPair<QString, QString> WorkloadScanner::parseLabel(const QString& label) {
    const QString trimmed = label.trimmed();
    const int idx = trimmed.indexOf('=');
    if (idx < 0) {
        return {trimmed, QString()};
    }
    return {trimmed.left(idx).trimmed(), trimmed.mid(idx + 1).trimmed()};
}

QJsonObject WorkloadScanner::scan(const QString& label, const ReportCallback& onReport) const {
    const auto [labelKey, labelValue] = parseLabel(label);
    if (labelKey.isEmpty()) {
        return {
            {"success", false},
            {"error", "Scan label must not be empty."},
            {"label", label},
        };
    }

    qCInfo(lcScanner) << "Scanning for pods with label" << label;
    QVector<PodRef> pods;
    try {
        pods = cluster_->listPodsByLabel(labelKey, labelValue);
    } catch (const std::exception& e) {
        qCWarning(lcScanner) << "Pod listing failed:" << e.what();
        Telemetry::instance().incrementCounter("scanner.listing_failures");
        return {
            {"success", false},
            {"error", QString::fromUtf8(e.what())},
            {"label", label},
        };
    }

    if (pods.isEmpty()) {
        qCInfo(lcScanner) << "No pods found with label" << label;
    }

    QJsonArray results;
    int succeeded = 0;
    int failed = 0;
    for (const PodRef& pod : pods) {
        qCInfo(lcScanner) << "Analyzing" << pod.nameSpace + "/" + pod.name;
        QJsonObject row{
            {"namespace", pod.nameSpace},
            {"pod", pod.name},
        };
        try {
            const RcaReport report = pipeline_->run(pod.nameSpace, pod.name);
            row.insert("success", true);
            row.insert("title", report.title);
            row.insert("issue", report.issue);
            row.insert("confidence", report.validationConfidence.value_or(0.0));
            succeeded++;
            Telemetry::instance().incrementCounter("scanner.targets_succeeded");
            qCInfo(lcScanner) << "Analysis completed for" << pod.name << "- decision:" << report.issue;
            if (onReport) {
                onReport(pod, report);
            }
        } catch (const std::exception& e) {
            row.insert("success", false);
            row.insert("error", QString::fromUtf8(e.what()));
            failed++;
            Telemetry::instance().incrementCounter("scanner.targets_failed");
            Telemetry::instance().recordEvent(
                "scan_target_failed",
                {
                    {"namespace", pod.nameSpace},
                    {"pod", pod.name},
                    {"error", QString::fromUtf8(e.what())},
                });
            qCWarning(lcScanner) << "Error analyzing pod" << pod.name << ":" << e.what();
        }
        results.append(row);
    }

    return {
        {"success", true},
        {"label", label},
        {"total_count", pods.size()},
        {"succeeded_count", succeeded},
        {"failed_count", failed},
        {"results", results},
    };
}

}  // namespace causa
