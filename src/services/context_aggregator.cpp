#include "causa/context_aggregator.hpp"

#include <QElapsedTimer>
#include <QStringList>

#include <algorithm>
#include <exception>
#include <utility>

#include "causa/logging.hpp"
#include "causa/metric_summarizer.hpp"
#include "causa/telemetry.hpp"

namespace causa {

namespace {

QString fetchError(const QString& section, const std::exception& e) {
    qCWarning(lcCollector) << "Failed to fetch" << section << ":" << e.what();
    Telemetry::instance().incrementCounter("collector.soft_failures");
    return QString("Error fetching %1: %2").arg(section, QString::fromUtf8(e.what()));
}

QString describeState(const ContainerState& state) {
    if (state.reason.isEmpty()) {
        return state.kind;
    }
    return QString("%1 (%2)").arg(state.kind, state.reason);
}

}  // namespace

ContextAggregator::ContextAggregator(
    ClusterInfo* cluster,
    const MetricSummarizer* summarizer,
    ProfilingBackend* profiling,
    int logTailLines)
    : cluster_(cluster),
      summarizer_(summarizer),
      profiling_(profiling),
      logTailLines_(std::clamp(logTailLines, 1, kMaxLogLines)) {}

QString ContextAggregator::formatPodStatus(const std::optional<PodStatus>& status) {
    if (!status.has_value()) {
        return "Pod not found";
    }

    QString out = "Phase: " + status->phase + "\n";
    for (const ContainerStatus& container : status->containers) {
        out += "Container: " + container.name + "\n";
        out += QString("  Ready: %1\n").arg(container.ready ? "true" : "false");
        out += QString("  Restart Count: %1\n").arg(container.restartCount);
        if (!container.currentState.kind.isEmpty()) {
            out += "  Current State: " + describeState(container.currentState) + "\n";
            if (!container.currentState.message.isEmpty()) {
                out += "  Message: " + container.currentState.message + "\n";
            }
        }
        if (container.lastTerminatedState.has_value()) {
            const ContainerState& last = *container.lastTerminatedState;
            out += QString("  Last State: Terminated (%1)\n").arg(last.reason);
            out += QString("  Exit Code: %1\n").arg(last.exitCode);
            out += "  Finished At: " + last.timestamp + "\n";
        }
    }
    return out;
}

QString ContextAggregator::formatEvents(const QVector<ClusterEvent>& events) {
    if (events.isEmpty()) {
        return "No events found for this pod.";
    }
    QString out;
    for (const ClusterEvent& event : events) {
        out += QString("[%1] Type: %2, Reason: %3, Message: %4\n")
                   .arg(event.timestamp, event.type, event.reason, event.message);
    }
    return out;
}

QString ContextAggregator::tailLines(const QString& text, int maxLines) {
    QStringList lines = text.split('\n');
    if (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }
    if (lines.size() <= maxLines) {
        return text;
    }
    return lines.mid(lines.size() - maxLines).join('\n') + "\n";
}

QString ContextAggregator::fetchPodStatus(const QString& nameSpace, const QString& target) const {
    try {
        return formatPodStatus(cluster_->podStatus(nameSpace, target));
    } catch (const std::exception& e) {
        return fetchError("pod status", e);
    }
}

QString ContextAggregator::fetchEvents(const QString& nameSpace, const QString& target) const {
    try {
        const QVector<ClusterEvent> events = cluster_->events(nameSpace, target);
        qCDebug(lcCollector) << "Gathered" << events.size() << "events";
        return formatEvents(events);
    } catch (const std::exception& e) {
        return fetchError("events", e);
    }
}

QString ContextAggregator::fetchLogs(const QString& nameSpace, const QString& target) const {
    try {
        QString logs = cluster_->logs(nameSpace, target, logTailLines_, false);
        if (logs.trimmed().isEmpty()) {
            qCInfo(lcCollector) << "Current logs empty, fetching previous container logs for" << target;
            logs = cluster_->logs(nameSpace, target, logTailLines_, true);
        }
        if (logs.isEmpty()) {
            return "No logs available (even from terminated container)";
        }
        return tailLines(logs, logTailLines_);
    } catch (const std::exception& e) {
        return fetchError("logs", e);
    }
}

QString ContextAggregator::fetchProfiling(const QString& target) const {
    if (profiling_ == nullptr) {
        return "JFR analysis is disabled.";
    }
    try {
        const QString report = profiling_->report(target);
        qCDebug(lcCollector) << "Gathered profiling report, length" << report.size();
        return report;
    } catch (const std::exception& e) {
        return fetchError("JFR analysis", e);
    }
}

DiagnosticContext ContextAggregator::collect(const QString& nameSpace, const QString& target) const {
    QElapsedTimer elapsed;
    elapsed.start();
    qCInfo(lcCollector) << "Collecting diagnostic context for" << nameSpace + "/" + target;

    QString status = fetchPodStatus(nameSpace, target);
    QString events = fetchEvents(nameSpace, target);
    QString metrics = summarizer_->summarize(nameSpace, target);
    QString logs = fetchLogs(nameSpace, target);
    QString profiling = fetchProfiling(target);

    DiagnosticContext context(
        std::move(status), std::move(events), std::move(metrics), std::move(logs), std::move(profiling));
    Telemetry::instance().recordDurationMs("collector.collect_ms", elapsed.elapsed());
    qCInfo(lcCollector) << "Context collected, metrics length" << context.metricsText().size()
                        << "full context length" << context.fullContext().size();
    return context;
}

}  // namespace causa
