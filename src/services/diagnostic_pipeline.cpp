#include "causa/diagnostic_pipeline.hpp"

#include <QElapsedTimer>
#include <QRegularExpression>

#include <utility>

#include "causa/context_aggregator.hpp"
#include "causa/logging.hpp"
#include "causa/reasoning_service.hpp"
#include "causa/telemetry.hpp"

namespace causa {

QString stageName(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Collecting:
        return "collecting";
    case PipelineStage::Detecting:
        return "detecting";
    case PipelineStage::HealthyShortCircuit:
        return "healthy_short_circuit";
    case PipelineStage::Analyzing:
        return "analyzing";
    case PipelineStage::Validating:
        return "validating";
    case PipelineStage::Done:
        return "done";
    }
    return "unknown";
}

DiagnosticPipeline::DiagnosticPipeline(const ContextAggregator* aggregator, ReasoningService* reasoning)
    : aggregator_(aggregator),
      reasoning_(reasoning) {}

void DiagnosticPipeline::setStageObserver(StageObserver observer) {
    observer_ = std::move(observer);
}

void DiagnosticPipeline::enter(PipelineStage stage) const {
    qCInfo(lcPipeline) << "Stage:" << stageName(stage);
    if (observer_) {
        observer_(stage);
    }
}

QString DiagnosticPipeline::sanitizeAnomaly(const QString& rawOutput) {
    QString token = rawOutput;
    const int lineBreak = token.indexOf(QRegularExpression("[\\r\\n]"));
    if (lineBreak >= 0) {
        token.truncate(lineBreak);
    }
    const int comment = token.indexOf('#');
    if (comment >= 0) {
        token.truncate(comment);
    }
    return token.trimmed();
}

bool DiagnosticPipeline::isHealthy(const QString& anomalyToken) {
    return anomalyToken.isEmpty() || anomalyToken.contains("HEALTHY", Qt::CaseInsensitive);
}

RcaReport DiagnosticPipeline::healthyReport() {
    RcaReport report;
    report.title = "System Healthy";
    report.issue = "No anomaly detected";
    report.evidence = "Metrics within normal range";
    report.proposedSolution = "No action needed";
    report.validationConfidence = 1.0;
    return report;
}

RcaReport DiagnosticPipeline::run(const QString& nameSpace, const QString& target) const {
    qCInfo(lcPipeline) << "Starting RCA analysis for" << nameSpace + "/" + target;
    Telemetry::instance().incrementCounter("pipeline.runs");

    QElapsedTimer elapsed;
    elapsed.start();
    enter(PipelineStage::Collecting);
    const DiagnosticContext context = aggregator_->collect(nameSpace, target);
    Telemetry::instance().recordDurationMs("pipeline.collecting_ms", elapsed.elapsed());

    return analyze(context);
}

RcaReport DiagnosticPipeline::analyze(const DiagnosticContext& context) const {
    const QString& fullContext = context.fullContext();
    QElapsedTimer elapsed;

    enter(PipelineStage::Detecting);
    qCDebug(lcPipeline).noquote() << "Context for detection:\n" << fullContext;
    elapsed.start();
    const QString rawAnomaly = reasoning_->classify(fullContext);
    Telemetry::instance().recordDurationMs("pipeline.detecting_ms", elapsed.elapsed());
    qCInfo(lcPipeline).noquote() << "Raw classifier output: [" + rawAnomaly + "]";

    const QString anomaly = sanitizeAnomaly(rawAnomaly);
    qCInfo(lcPipeline).noquote() << "Sanitized anomaly token: [" + anomaly + "]";

    if (isHealthy(anomaly)) {
        enter(PipelineStage::HealthyShortCircuit);
        Telemetry::instance().incrementCounter("pipeline.healthy_short_circuits");
        RcaReport report = healthyReport();
        enter(PipelineStage::Done);
        return report;
    }

    Telemetry::instance().incrementCounter("pipeline.anomalies");
    Telemetry::instance().recordEvent("anomaly_detected", {{"anomaly", anomaly}});

    enter(PipelineStage::Analyzing);
    elapsed.restart();
    const QString rcaOutput = reasoning_->explainRootCause(anomaly, fullContext);
    Telemetry::instance().recordDurationMs("pipeline.analyzing_ms", elapsed.elapsed());
    qCDebug(lcPipeline).noquote() << "Root cause output:\n" << rcaOutput;

    enter(PipelineStage::Validating);
    elapsed.restart();
    RcaReport report = reasoning_->validateAndFormat(rcaOutput, fullContext);
    Telemetry::instance().recordDurationMs("pipeline.validating_ms", elapsed.elapsed());
    qCInfo(lcPipeline) << "Validated report:" << report.title;

    enter(PipelineStage::Done);
    return report;
}

}  // namespace causa
