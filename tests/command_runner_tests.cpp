#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QUrlQuery>

#include "causa/command_runner.hpp"
#include "causa/metrics_backends.hpp"
#include "causa/telemetry.hpp"
#include "test_support.hpp"

using namespace causa;

TEST(CommandRunnerTest, CapturesOutputAndExitCode)
{
    const CommandResult result = CommandRunner::run("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.stdoutText.trimmed(), "out");
    EXPECT_EQ(result.stderrText.trimmed(), "err");
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.failureText(), "err");
}

TEST(CommandRunnerTest, PassesExtraEnvironment)
{
    const CommandResult result =
        CommandRunner::run("/bin/sh", {"-c", "printf %s \"$CAUSA_TEST_VALUE\""}, 5000, {{"CAUSA_TEST_VALUE", "42"}});
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdoutText, "42");
}

TEST(CommandRunnerTest, MissingProgram)
{
    const CommandResult result = CommandRunner::run("/nonexistent/causa-kubectl", {}, 2000);
    EXPECT_FALSE(result.success());
    EXPECT_FALSE(result.failureText().isEmpty());
}

TEST(CommandRunnerTest, FailureTextFallsBackToExitCode)
{
    CommandResult result;
    result.exitCode = 9;
    EXPECT_EQ(result.failureText(), "Command exited with code 9.");
}

TEST(TelemetryTest, CountersAndExport)
{
    Telemetry& telemetry = Telemetry::instance();
    const qint64 before = telemetry.counter("tests.telemetry");
    telemetry.incrementCounter("tests.telemetry");
    telemetry.incrementCounter("tests.telemetry", 2);
    telemetry.recordDurationMs("tests.duration_ms", 40);
    telemetry.recordEvent("tests_event", {{"pod", "api-7"}});
    EXPECT_EQ(telemetry.counter("tests.telemetry"), before + 3);

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("nested/telemetry.json");
    const QJsonObject result = telemetry.exportToFile(path);
    ASSERT_TRUE(result.value("success").toBool()) << result.value("error").toString().toStdString();

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QJsonObject exported = QJsonDocument::fromJson(file.readAll()).object();
    EXPECT_TRUE(exported.value("counters").toObject().contains("tests.telemetry"));
    EXPECT_TRUE(exported.value("durations").toObject().contains("tests.duration_ms"));
}

TEST(BackendUrlTest, PrometheusQueryIsEncoded)
{
    const QUrl url = PrometheusBackend::queryUrl(QUrl("http://prom:9090/"), "sum(up{job=\"api\"})");
    EXPECT_EQ(url.path(), "/api/v1/query");
    EXPECT_EQ(url.host(), "prom");
    EXPECT_EQ(QUrlQuery(url).queryItemValue("query", QUrl::FullyDecoded), "sum(up{job=\"api\"})");
}

TEST(BackendUrlTest, CryostatReportPath)
{
    const QUrl url = CryostatBackend::reportUrl(QUrl("https://cryostat.example:8181"), "api-7");
    EXPECT_EQ(url.toString(), "https://cryostat.example:8181/api/v1/targets/api-7/reports");
}
