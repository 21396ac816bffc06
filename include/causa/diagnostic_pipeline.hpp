#pragma once

#include <QString>

#include <functional>

#include "causa/diagnostic_context.hpp"
#include "causa/rca_report.hpp"

namespace causa {

class ContextAggregator;
class ReasoningService;

enum class PipelineStage {
    Collecting,
    Detecting,
    HealthyShortCircuit,
    Analyzing,
    Validating,
    Done,
};

QString stageName(PipelineStage stage);

// Drives collect -> detect -> analyze -> validate for one target. Runs are
// independent; the pipeline keeps no state between them.
class DiagnosticPipeline {
public:
    using StageObserver = std::function<void(PipelineStage)>;

    DiagnosticPipeline(const ContextAggregator* aggregator, ReasoningService* reasoning);

    RcaReport run(const QString& nameSpace, const QString& target) const;
    RcaReport analyze(const DiagnosticContext& context) const;

    void setStageObserver(StageObserver observer);

    // First line of the classifier output, cut at the first '#', trimmed.
    static QString sanitizeAnomaly(const QString& rawOutput);
    // Empty tokens and any token mentioning HEALTHY (any case) count as healthy.
    static bool isHealthy(const QString& anomalyToken);
    static RcaReport healthyReport();

private:
    void enter(PipelineStage stage) const;

    const ContextAggregator* aggregator_;
    ReasoningService* reasoning_;
    StageObserver observer_;
};

}  // namespace causa
