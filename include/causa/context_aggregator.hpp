#pragma once

#include <QString>
#include <QVector>

#include <optional>

#include "causa/collaborators.hpp"
#include "causa/diagnostic_context.hpp"

namespace causa {

class MetricSummarizer;

// Gathers status, events, metrics, logs and profiling for one target. A failing
// source turns into an error line in its own section; the rest are still collected.
class ContextAggregator {
public:
    static constexpr int kMaxLogLines = 500;

    // A null profiling backend means profiling integration is disabled.
    ContextAggregator(
        ClusterInfo* cluster,
        const MetricSummarizer* summarizer,
        ProfilingBackend* profiling = nullptr,
        int logTailLines = kMaxLogLines);

    DiagnosticContext collect(const QString& nameSpace, const QString& target) const;

    static QString formatPodStatus(const std::optional<PodStatus>& status);
    static QString formatEvents(const QVector<ClusterEvent>& events);
    static QString tailLines(const QString& text, int maxLines);

private:
    QString fetchPodStatus(const QString& nameSpace, const QString& target) const;
    QString fetchEvents(const QString& nameSpace, const QString& target) const;
    QString fetchLogs(const QString& nameSpace, const QString& target) const;
    QString fetchProfiling(const QString& target) const;

    ClusterInfo* cluster_;
    const MetricSummarizer* summarizer_;
    ProfilingBackend* profiling_;
    int logTailLines_;
};

}  // namespace causa
