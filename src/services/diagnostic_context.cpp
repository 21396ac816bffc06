#include "causa/diagnostic_context.hpp"

#include <QPair>

#include <utility>

namespace causa {

const char* const DiagnosticContext::kStatusHeader = "--- POD STATUS ---";
const char* const DiagnosticContext::kEventsHeader = "--- K8S EVENTS ---";
const char* const DiagnosticContext::kMetricsHeader = "--- METRICS ---";
const char* const DiagnosticContext::kLogsHeader = "--- LOGS (Tail) ---";
const char* const DiagnosticContext::kProfilingHeader = "--- PROFILING (JFR) ---";

DiagnosticContext::DiagnosticContext(
    QString podStatusText,
    QString eventsText,
    QString metricsText,
    QString logsText,
    QString profilingText)
    : podStatusText_(std::move(podStatusText)),
      eventsText_(std::move(eventsText)),
      metricsText_(std::move(metricsText)),
      logsText_(std::move(logsText)),
      profilingText_(std::move(profilingText)),
      fullContext_(assemble(podStatusText_, eventsText_, metricsText_, logsText_, profilingText_)) {}

QString DiagnosticContext::assemble(
    const QString& podStatusText,
    const QString& eventsText,
    const QString& metricsText,
    const QString& logsText,
    const QString& profilingText) {
    const QPair<const char*, const QString*> sections[] = {
        {kStatusHeader, &podStatusText},
        {kEventsHeader, &eventsText},
        {kMetricsHeader, &metricsText},
        {kLogsHeader, &logsText},
        {kProfilingHeader, &profilingText},
    };

    QString out;
    for (const auto& [header, body] : sections) {
        if (!out.isEmpty()) {
            out += '\n';
        }
        out += QString::fromLatin1(header);
        out += '\n';
        out += *body;
        out += '\n';
    }
    return out;
}

}  // namespace causa
