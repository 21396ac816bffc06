#include <gtest/gtest.h>

#include <QVector>

#include "causa/context_aggregator.hpp"
#include "causa/diagnostic_pipeline.hpp"
#include "causa/metric_summarizer.hpp"
#include "causa/service_error.hpp"
#include "causa/telemetry.hpp"
#include "test_support.hpp"

using namespace causa;
using namespace causa::testing;

namespace {

class DiagnosticPipelineTest : public ::testing::Test {
protected:
    DiagnosticPipelineTest()
        : summarizer(&cluster, &metrics),
          aggregator(&cluster, &summarizer, &profiling),
          pipeline(&aggregator, &reasoning) {
        cluster.status = PodStatus{"Running", {}};
        cluster.currentLogs = "started\n";
        reasoning.validated.title = "OOM";
        reasoning.validated.issue = "x";
        reasoning.validated.evidence = "y";
        reasoning.validated.proposedSolution = "z";
        reasoning.validated.validationConfidence = 0.95;
    }

    StubCluster cluster;
    StubMetrics metrics;
    StubProfiling profiling;
    StubReasoning reasoning;
    MetricSummarizer summarizer;
    ContextAggregator aggregator;
    DiagnosticPipeline pipeline;
};

}  // namespace

TEST(DiagnosticPipelineStaticTest, SanitizeKeepsFirstLineBeforeComment)
{
    EXPECT_EQ(DiagnosticPipeline::sanitizeAnomaly("HEALTHY\n# note"), "HEALTHY");
    EXPECT_EQ(DiagnosticPipeline::sanitizeAnomaly("  OOM_KILLED  # heap exhausted\nmore"), "OOM_KILLED");
    EXPECT_EQ(DiagnosticPipeline::sanitizeAnomaly("CPU_THROTTLING\r\nextra"), "CPU_THROTTLING");
    EXPECT_EQ(DiagnosticPipeline::sanitizeAnomaly("# only a comment"), "");
    EXPECT_EQ(DiagnosticPipeline::sanitizeAnomaly(""), "");
}

TEST(DiagnosticPipelineStaticTest, HealthyMatchIsCaseInsensitiveSubstring)
{
    EXPECT_TRUE(DiagnosticPipeline::isHealthy(""));
    EXPECT_TRUE(DiagnosticPipeline::isHealthy("HEALTHY"));
    EXPECT_TRUE(DiagnosticPipeline::isHealthy("healthy"));
    EXPECT_TRUE(DiagnosticPipeline::isHealthy("UNHEALTHY"));
    EXPECT_FALSE(DiagnosticPipeline::isHealthy("OOM_KILLED"));
}

TEST(DiagnosticPipelineStaticTest, HealthyReportContents)
{
    const RcaReport report = DiagnosticPipeline::healthyReport();
    EXPECT_EQ(report.title, "System Healthy");
    EXPECT_EQ(report.issue, "No anomaly detected");
    EXPECT_EQ(report.evidence, "Metrics within normal range");
    EXPECT_EQ(report.proposedSolution, "No action needed");
    EXPECT_TRUE(report.supportedLogs.isEmpty());
    ASSERT_TRUE(report.validationConfidence.has_value());
    EXPECT_DOUBLE_EQ(*report.validationConfidence, 1.0);
}

TEST(DiagnosticPipelineStaticTest, StageNames)
{
    EXPECT_EQ(stageName(PipelineStage::Collecting), "collecting");
    EXPECT_EQ(stageName(PipelineStage::HealthyShortCircuit), "healthy_short_circuit");
    EXPECT_EQ(stageName(PipelineStage::Done), "done");
}

TEST_F(DiagnosticPipelineTest, HealthyClassificationSkipsAnalysis)
{
    reasoning.classification = "HEALTHY\n# note";
    const RcaReport report = pipeline.run("default", "web-1");

    EXPECT_EQ(reasoning.classifyCalls, 1);
    EXPECT_EQ(reasoning.explainCalls, 0);
    EXPECT_EQ(reasoning.validateCalls, 0);
    EXPECT_EQ(report.title, "System Healthy");
}

TEST_F(DiagnosticPipelineTest, VerboseHealthyAnswerSkipsAnalysis)
{
    reasoning.classification = "Pod looks healthy overall\nNo restarts seen.";
    const RcaReport report = pipeline.run("default", "web-1");

    EXPECT_EQ(reasoning.classifyCalls, 1);
    EXPECT_EQ(reasoning.explainCalls, 0);
    EXPECT_EQ(reasoning.validateCalls, 0);
    EXPECT_EQ(report.title, "System Healthy");
}

TEST_F(DiagnosticPipelineTest, EmptyClassificationCountsAsHealthy)
{
    reasoning.classification = "   ";
    const RcaReport report = pipeline.run("default", "web-1");

    EXPECT_EQ(reasoning.explainCalls, 0);
    EXPECT_EQ(report.title, "System Healthy");
}

TEST_F(DiagnosticPipelineTest, AnomalyRunsAllThreeSteps)
{
    reasoning.classification = "OOM_KILLED # heap\nextra text";
    const RcaReport report = pipeline.run("prod", "api-7");

    EXPECT_EQ(reasoning.classifyCalls, 1);
    EXPECT_EQ(reasoning.explainCalls, 1);
    EXPECT_EQ(reasoning.validateCalls, 1);
    EXPECT_EQ(reasoning.lastAnomaly, "OOM_KILLED");
    EXPECT_EQ(reasoning.lastRcaText, reasoning.explanation);
    EXPECT_EQ(report.title, "OOM");
    ASSERT_TRUE(report.validationConfidence.has_value());
    EXPECT_DOUBLE_EQ(*report.validationConfidence, 0.95);
}

TEST_F(DiagnosticPipelineTest, EveryStepSeesTheAssembledContext)
{
    reasoning.classification = "OOM_KILLED";
    pipeline.run("prod", "api-7");

    EXPECT_TRUE(reasoning.lastContext.startsWith(DiagnosticContext::kStatusHeader));
    EXPECT_TRUE(reasoning.lastContext.contains("Phase: Running"));
    EXPECT_TRUE(reasoning.lastContext.contains("started"));
    EXPECT_TRUE(reasoning.lastContext.contains(profiling.text));
}

TEST_F(DiagnosticPipelineTest, StagesAreReportedInOrder)
{
    QVector<PipelineStage> stages;
    pipeline.setStageObserver([&stages](PipelineStage stage) { stages.append(stage); });

    reasoning.classification = "OOM_KILLED";
    pipeline.run("prod", "api-7");
    const QVector<PipelineStage> anomalous = {
        PipelineStage::Collecting,
        PipelineStage::Detecting,
        PipelineStage::Analyzing,
        PipelineStage::Validating,
        PipelineStage::Done,
    };
    EXPECT_EQ(stages, anomalous);

    stages.clear();
    reasoning.classification = "HEALTHY";
    pipeline.run("prod", "api-7");
    const QVector<PipelineStage> healthy = {
        PipelineStage::Collecting,
        PipelineStage::Detecting,
        PipelineStage::HealthyShortCircuit,
        PipelineStage::Done,
    };
    EXPECT_EQ(stages, healthy);
}

TEST_F(DiagnosticPipelineTest, ReasoningFailurePropagates)
{
    reasoning.classification = "OOM_KILLED";
    reasoning.failExplain = true;

    EXPECT_THROW(pipeline.run("prod", "api-7"), ServiceError);
    EXPECT_EQ(reasoning.validateCalls, 0);
}

TEST_F(DiagnosticPipelineTest, ClassifierFailurePropagates)
{
    reasoning.failClassify = true;
    EXPECT_THROW(pipeline.run("prod", "api-7"), ServiceError);
    EXPECT_EQ(reasoning.explainCalls, 0);
}

TEST_F(DiagnosticPipelineTest, CollectorFailuresDoNotStopTheRun)
{
    cluster.failStatus = true;
    cluster.failEvents = true;
    cluster.failLogs = true;
    metrics.fail = true;
    profiling.fail = true;
    reasoning.classification = "CRASH_LOOP";

    const RcaReport report = pipeline.run("prod", "api-7");
    EXPECT_EQ(report.title, "OOM");
    EXPECT_TRUE(reasoning.lastContext.contains("Error fetching logs: container not started"));
}

TEST_F(DiagnosticPipelineTest, AnalyzeAcceptsPrebuiltContext)
{
    const DiagnosticContext context("Phase: Failed\n", "none", "metrics", "boom", "JFR analysis is disabled.");
    reasoning.classification = "OOM_KILLED";

    pipeline.analyze(context);
    EXPECT_EQ(reasoning.lastContext, context.fullContext());
    EXPECT_TRUE(cluster.logRequests.isEmpty());
}

TEST_F(DiagnosticPipelineTest, CountsHealthyShortCircuits)
{
    const qint64 before = Telemetry::instance().counter("pipeline.healthy_short_circuits");
    reasoning.classification = "HEALTHY";
    pipeline.run("default", "web-1");
    EXPECT_EQ(Telemetry::instance().counter("pipeline.healthy_short_circuits"), before + 1);
}
