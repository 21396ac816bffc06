#pragma once

#include <QString>

namespace causa {

// Everything collected about one target. The full context is derived from the
// five sections at construction and cannot be set independently.
class DiagnosticContext {
public:
    DiagnosticContext(
        QString podStatusText,
        QString eventsText,
        QString metricsText,
        QString logsText,
        QString profilingText);

    [[nodiscard]] const QString& podStatusText() const { return podStatusText_; }
    [[nodiscard]] const QString& eventsText() const { return eventsText_; }
    [[nodiscard]] const QString& metricsText() const { return metricsText_; }
    [[nodiscard]] const QString& logsText() const { return logsText_; }
    [[nodiscard]] const QString& profilingText() const { return profilingText_; }
    [[nodiscard]] const QString& fullContext() const { return fullContext_; }

    static QString assemble(
        const QString& podStatusText,
        const QString& eventsText,
        const QString& metricsText,
        const QString& logsText,
        const QString& profilingText);

    static const char* const kStatusHeader;
    static const char* const kEventsHeader;
    static const char* const kMetricsHeader;
    static const char* const kLogsHeader;
    static const char* const kProfilingHeader;

private:
    QString podStatusText_;
    QString eventsText_;
    QString metricsText_;
    QString logsText_;
    QString profilingText_;
    QString fullContext_;
};

}  // namespace causa
