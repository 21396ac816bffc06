#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>

#include "causa/context_aggregator.hpp"
#include "causa/diagnostic_pipeline.hpp"
#include "causa/metric_summarizer.hpp"
#include "causa/service_error.hpp"
#include "causa/workload_scanner.hpp"
#include "test_support.hpp"

using namespace causa;
using namespace causa::testing;

namespace {

// Fails validation for one pod, identified by its logs showing up in the context.
class SelectiveReasoning : public StubReasoning {
public:
    QString failingMarker;

    RcaReport validateAndFormat(const QString& rcaText, const QString& context) override {
        if (!failingMarker.isEmpty() && context.contains(failingMarker)) {
            validateCalls++;
            throw ServiceError("validator returned garbage");
        }
        return StubReasoning::validateAndFormat(rcaText, context);
    }
};

// Serves logs naming the pod they were requested for.
class NamedLogsCluster : public StubCluster {
public:
    QString logs(const QString& nameSpace, const QString& name, int tailLines, bool previous) override {
        StubCluster::logs(nameSpace, name, tailLines, previous);
        return "logs of " + name + "\n";
    }
};

class WorkloadScannerTest : public ::testing::Test {
protected:
    WorkloadScannerTest()
        : summarizer(&cluster, &metrics),
          aggregator(&cluster, &summarizer),
          pipeline(&aggregator, &reasoning),
          scanner(&cluster, &pipeline) {
        cluster.pods = {PodRef{"prod", "api-1"}, PodRef{"prod", "api-2"}, PodRef{"batch", "worker-1"}};
        reasoning.validated.title = "OOM";
        reasoning.validated.issue = "Heap exhausted";
        reasoning.validated.validationConfidence = 0.9;
    }

    NamedLogsCluster cluster;
    StubMetrics metrics;
    SelectiveReasoning reasoning;
    MetricSummarizer summarizer;
    ContextAggregator aggregator;
    DiagnosticPipeline pipeline;
    WorkloadScanner scanner;
};

}  // namespace

TEST(WorkloadScannerLabelTest, ParseLabel)
{
    EXPECT_EQ(WorkloadScanner::parseLabel("causa.io/rca=enabled"),
              (QPair<QString, QString>("causa.io/rca", "enabled")));
    EXPECT_EQ(WorkloadScanner::parseLabel(" app = web "), (QPair<QString, QString>("app", "web")));
    EXPECT_EQ(WorkloadScanner::parseLabel("tier"), (QPair<QString, QString>("tier", "")));
    EXPECT_TRUE(WorkloadScanner::parseLabel("=x").first.isEmpty());
}

TEST_F(WorkloadScannerTest, AnalyzesEveryLabelledPod)
{
    QStringList reported;
    const QJsonObject summary = scanner.scan("app=api", [&reported](const PodRef& pod, const RcaReport& report) {
        reported.append(pod.nameSpace + "/" + pod.name + ":" + report.title);
    });

    EXPECT_TRUE(summary.value("success").toBool());
    EXPECT_EQ(summary.value("total_count").toInt(), 3);
    EXPECT_EQ(summary.value("succeeded_count").toInt(), 3);
    EXPECT_EQ(summary.value("failed_count").toInt(), 0);
    EXPECT_EQ(reported, (QStringList{"prod/api-1:OOM", "prod/api-2:OOM", "batch/worker-1:OOM"}));

    const QJsonObject first = summary.value("results").toArray().at(0).toObject();
    EXPECT_EQ(first.value("namespace").toString(), "prod");
    EXPECT_EQ(first.value("pod").toString(), "api-1");
    EXPECT_EQ(first.value("issue").toString(), "Heap exhausted");
    EXPECT_DOUBLE_EQ(first.value("confidence").toDouble(), 0.9);
}

TEST_F(WorkloadScannerTest, OneFailingPodDoesNotStopTheScan)
{
    reasoning.failingMarker = "logs of api-2";
    int callbacks = 0;
    const QJsonObject summary = scanner.scan("app=api", [&callbacks](const PodRef&, const RcaReport&) {
        callbacks++;
    });

    EXPECT_TRUE(summary.value("success").toBool());
    EXPECT_EQ(summary.value("succeeded_count").toInt(), 2);
    EXPECT_EQ(summary.value("failed_count").toInt(), 1);
    EXPECT_EQ(callbacks, 2);

    const QJsonArray results = summary.value("results").toArray();
    ASSERT_EQ(results.size(), 3);
    const QJsonObject failed = results.at(1).toObject();
    EXPECT_EQ(failed.value("pod").toString(), "api-2");
    EXPECT_FALSE(failed.value("success").toBool(true));
    EXPECT_EQ(failed.value("error").toString(), "validator returned garbage");
    EXPECT_TRUE(results.at(2).toObject().value("success").toBool());
}

TEST_F(WorkloadScannerTest, NoMatchingPods)
{
    cluster.pods.clear();
    const QJsonObject summary = scanner.scan("app=none");

    EXPECT_TRUE(summary.value("success").toBool());
    EXPECT_EQ(summary.value("total_count").toInt(), 0);
    EXPECT_TRUE(summary.value("results").toArray().isEmpty());
    EXPECT_EQ(reasoning.classifyCalls, 0);
}

TEST_F(WorkloadScannerTest, ListingFailureFailsTheScan)
{
    cluster.failListing = true;
    const QJsonObject summary = scanner.scan("app=api");

    EXPECT_FALSE(summary.value("success").toBool(true));
    EXPECT_EQ(summary.value("error").toString(), "list forbidden");
}

TEST_F(WorkloadScannerTest, EmptyLabelIsRejected)
{
    const QJsonObject summary = scanner.scan("  ");
    EXPECT_FALSE(summary.value("success").toBool(true));
    EXPECT_EQ(reasoning.classifyCalls, 0);
}
