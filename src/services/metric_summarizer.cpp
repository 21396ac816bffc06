#include "causa/metric_summarizer.hpp"

#include <QJsonArray>
#include <QJsonValue>
#include <QStringList>

#include <cmath>
#include <exception>

#include "causa/logging.hpp"

namespace causa {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

QString selector(const QString& nameSpace, const QString& target) {
    return QString("pod=\"%1\", namespace=\"%2\", container!=\"\", image!=\"\"").arg(target, nameSpace);
}

double sampleValue(const QJsonValue& value, bool* ok) {
    if (value.isDouble()) {
        *ok = true;
        return value.toDouble();
    }
    return value.toString().trimmed().toDouble(ok);
}

QString fixed(double value, int decimals) {
    return QString::number(value, 'f', decimals);
}

}  // namespace

MetricSummarizer::MetricSummarizer(ClusterInfo* cluster, MetricsBackend* metrics)
    : cluster_(cluster),
      metrics_(metrics) {}

QString MetricSummarizer::memoryUsageQuery(const QString& nameSpace, const QString& target) {
    return QString("sum(container_memory_usage_bytes{%1})").arg(selector(nameSpace, target));
}

QString MetricSummarizer::memoryLimitQuery(const QString& nameSpace, const QString& target) {
    return QString("sum(container_spec_memory_limit_bytes{%1})").arg(selector(nameSpace, target));
}

QString MetricSummarizer::cpuUsageQuery(const QString& nameSpace, const QString& target) {
    return QString("sum(rate(container_cpu_usage_seconds_total{%1}[5m]))").arg(selector(nameSpace, target));
}

QString MetricSummarizer::cpuLimitQuery(const QString& nameSpace, const QString& target) {
    const QString sel = selector(nameSpace, target);
    return QString("sum(container_spec_cpu_quota{%1}) / sum(container_spec_cpu_period{%1})").arg(sel);
}

QString MetricSummarizer::jvmHeapQuery(const QString& nameSpace, const QString& target) {
    return QString("sum(jvm_memory_used_bytes{pod=\"%1\", namespace=\"%2\", area=\"heap\"})")
        .arg(target, nameSpace);
}

QString MetricSummarizer::formatResourceMap(const QMap<QString, QString>& values) {
    QStringList parts;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        parts.append(it.key() + "=" + it.value());
    }
    return "{" + parts.join(", ") + "}";
}

double MetricSummarizer::extractValue(const QJsonObject& response) {
    const QJsonObject data = response.value("data").toObject();
    const QJsonValue result = data.value("result");
    if (!result.isArray()) {
        if (!response.isEmpty()) {
            qCWarning(lcMetrics) << "Metric response has no result list, using 0.0";
        }
        return 0.0;
    }

    const QJsonArray series = result.toArray();
    if (series.isEmpty()) {
        return 0.0;
    }

    QJsonArray sample;
    if (data.value("resultType").toString() == "scalar") {
        sample = series;
    } else {
        const QJsonObject first = series.at(0).toObject();
        sample = first.value("value").toArray();
        if (sample.isEmpty()) {
            const QJsonArray values = first.value("values").toArray();
            if (!values.isEmpty()) {
                sample = values.last().toArray();
            }
        }
    }

    if (sample.size() < 2) {
        qCWarning(lcMetrics) << "Metric series has no usable sample, using 0.0";
        return 0.0;
    }

    bool ok = false;
    const double value = sampleValue(sample.at(1), &ok);
    if (!ok || !std::isfinite(value)) {
        qCWarning(lcMetrics) << "Could not parse metric sample" << sample.at(1) << "- using 0.0";
        return 0.0;
    }
    return value;
}

QString MetricSummarizer::summarize(const QString& nameSpace, const QString& target) const {
    qCInfo(lcMetrics) << "Fetching detailed metrics for" << nameSpace + "/" + target;
    try {
        QString limits = "N/A";
        QString requests = "N/A";
        const std::optional<PodSpec> spec = cluster_->podSpec(nameSpace, target);
        if (spec.has_value()) {
            limits = formatResourceMap(spec->limits);
            requests = formatResourceMap(spec->requests);
        }
        qCDebug(lcMetrics) << "Limits:" << limits << "Requests:" << requests;

        double memUsageBytes = extractValue(metrics_->query(memoryUsageQuery(nameSpace, target)));
        const double memLimitBytes = extractValue(metrics_->query(memoryLimitQuery(nameSpace, target)));
        const double cpuUsageCores = extractValue(metrics_->query(cpuUsageQuery(nameSpace, target)));
        const double cpuLimitCores = extractValue(metrics_->query(cpuLimitQuery(nameSpace, target)));

        if (memUsageBytes == 0.0) {
            qCInfo(lcMetrics) << "Container memory usage is 0, falling back to JVM heap usage";
            memUsageBytes = extractValue(metrics_->query(jvmHeapQuery(nameSpace, target)));
        }

        const double memPercent = memLimitBytes > 0 ? (memUsageBytes / memLimitBytes) * 100.0 : 0.0;
        const double cpuPercent = cpuLimitCores > 0 ? (cpuUsageCores / cpuLimitCores) * 100.0 : 0.0;

        const auto bracketed = [](QString text) {
            return text.replace('{', '[').replace('}', ']');
        };

        QString out;
        out += "--- DETAILED RESOURCE METRICS ---\n";
        out += QString("TARGET: %1/%2\n").arg(nameSpace, target);
        out += "\n";
        out += "K8S RESOURCE CONFIG:\n";
        out += "  Limits:   " + bracketed(limits) + "\n";
        out += "  Requests: " + bracketed(requests) + "\n";
        out += "\n";
        out += "PROMETHEUS REAL-TIME DATA:\n";
        out += QString("  Memory Usage: %1 MB (%2% of limit)\n")
                   .arg(fixed(memUsageBytes / kBytesPerMb, 2), fixed(memPercent, 2));
        out += QString("  Memory Limit: %1 MB\n").arg(fixed(memLimitBytes / kBytesPerMb, 2));
        out += QString("  CPU Usage:    %1 Cores (%2% of limit)\n")
                   .arg(fixed(cpuUsageCores, 3), fixed(cpuPercent, 2));
        out += QString("  CPU Limit:    %1 Cores\n").arg(fixed(cpuLimitCores, 3));
        out += "---\n";
        return out;
    } catch (const std::exception& e) {
        qCWarning(lcMetrics) << "Metric collection failed for" << target << ":" << e.what();
        return QString("Error fetching detailed metrics: %1").arg(QString::fromUtf8(e.what()));
    }
}

}  // namespace causa
