#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "causa/chat_reasoner.hpp"
#include "causa/rca_report.hpp"
#include "causa/service_error.hpp"
#include "test_support.hpp"

using namespace causa;

TEST(RcaReportTest, ReadsValidatorFields)
{
    const QJsonObject object{
        {"title", "OOM Killed - Memory Limit Exceeded"},
        {"issue", "Heap exceeded the 512Mi limit."},
        {"evidence", "Memory at 99% of limit, exit code 137."},
        {"supportedLogs", QJsonArray{"java.lang.OutOfMemoryError", "", "GC overhead limit exceeded"}},
        {"proposedSolution", "Raise the limit to 1Gi and cap -Xmx at 75%."},
        {"validationConfidence", 0.92},
    };
    const RcaReport report = RcaReport::fromJson(object);

    EXPECT_EQ(report.title, "OOM Killed - Memory Limit Exceeded");
    EXPECT_EQ(report.issue, "Heap exceeded the 512Mi limit.");
    EXPECT_EQ(report.supportedLogs, (QStringList{"java.lang.OutOfMemoryError", "GC overhead limit exceeded"}));
    ASSERT_TRUE(report.validationConfidence.has_value());
    EXPECT_DOUBLE_EQ(*report.validationConfidence, 0.92);
}

TEST(RcaReportTest, LenientShapes)
{
    const QJsonObject object{
        {"title", "Crash"},
        {"supportedLogs", "single log line"},
        {"validationConfidence", "0.7"},
    };
    const RcaReport report = RcaReport::fromJson(object);

    EXPECT_EQ(report.supportedLogs, QStringList{"single log line"});
    EXPECT_TRUE(report.issue.isEmpty());
    ASSERT_TRUE(report.validationConfidence.has_value());
    EXPECT_DOUBLE_EQ(*report.validationConfidence, 0.7);
}

TEST(RcaReportTest, ConfidenceIsClampedOrDropped)
{
    EXPECT_DOUBLE_EQ(*RcaReport::fromJson({{"validationConfidence", 1.7}}).validationConfidence, 1.0);
    EXPECT_DOUBLE_EQ(*RcaReport::fromJson({{"validationConfidence", -0.2}}).validationConfidence, 0.0);
    EXPECT_FALSE(RcaReport::fromJson({{"validationConfidence", "high"}}).validationConfidence.has_value());
    EXPECT_FALSE(RcaReport::fromJson({{"validationConfidence", QJsonValue::Null}}).validationConfidence.has_value());
    EXPECT_FALSE(RcaReport::fromJson(QJsonObject()).validationConfidence.has_value());
}

TEST(RcaReportTest, JsonOutput)
{
    RcaReport report;
    report.title = "OOM";
    report.supportedLogs = {"a", "b"};
    QJsonObject json = report.toJson();

    EXPECT_EQ(json.value("title").toString(), "OOM");
    EXPECT_EQ(json.value("supportedLogs").toArray().size(), 2);
    EXPECT_TRUE(json.value("validationConfidence").isNull());

    report.validationConfidence = 0.5;
    json = report.toJson();
    EXPECT_DOUBLE_EQ(json.value("validationConfidence").toDouble(), 0.5);
    EXPECT_EQ(RcaReport::fromJson(json).supportedLogs, report.supportedLogs);
}

TEST(ChatReasonerParsingTest, RequestBody)
{
    const QJsonObject withSystem = ChatReasoner::buildRequest("detector", "system text", "user text");
    EXPECT_EQ(withSystem.value("model").toString(), "detector");
    const QJsonArray messages = withSystem.value("messages").toArray();
    ASSERT_EQ(messages.size(), 2);
    EXPECT_EQ(messages.at(0).toObject().value("role").toString(), "system");
    EXPECT_EQ(messages.at(1).toObject().value("content").toString(), "user text");
    EXPECT_DOUBLE_EQ(withSystem.value("temperature").toDouble(-1), 0.0);

    const QJsonObject userOnly = ChatReasoner::buildRequest("rca", QString(), "prompt");
    ASSERT_EQ(userOnly.value("messages").toArray().size(), 1);
    EXPECT_EQ(userOnly.value("messages").toArray().at(0).toObject().value("role").toString(), "user");
}

TEST(ChatReasonerParsingTest, MessageContent)
{
    const QByteArray body = R"({"choices":[{"index":0,"message":{"role":"assistant","content":"OOM_KILLED"}}]})";
    EXPECT_EQ(ChatReasoner::messageContent(body), "OOM_KILLED");
}

TEST(ChatReasonerParsingTest, MessageContentFailures)
{
    EXPECT_THROW(ChatReasoner::messageContent("not json"), ServiceError);
    EXPECT_THROW(ChatReasoner::messageContent(R"({"choices":[]})"), ServiceError);
    EXPECT_THROW(ChatReasoner::messageContent(R"({"choices":[{"message":{}}]})"), ServiceError);

    try {
        ChatReasoner::messageContent(R"({"error":{"message":"model not loaded"}})");
        FAIL() << "expected ServiceError";
    } catch (const ServiceError& e) {
        EXPECT_TRUE(e.message().contains("model not loaded"));
    }
}

TEST(ChatReasonerParsingTest, ExtractsJsonFromFencedReply)
{
    const QString reply =
        "Here is the report:\n```json\n{\"title\": \"OOM\", \"validationConfidence\": 0.8}\n```\nDone.";
    const QJsonObject object = ChatReasoner::extractJsonObject(reply);
    EXPECT_EQ(object.value("title").toString(), "OOM");
    EXPECT_DOUBLE_EQ(object.value("validationConfidence").toDouble(), 0.8);
}

TEST(ChatReasonerParsingTest, ExtractRejectsReplyWithoutObject)
{
    EXPECT_THROW(ChatReasoner::extractJsonObject("no json here"), ServiceError);
    EXPECT_THROW(ChatReasoner::extractJsonObject("} backwards {"), ServiceError);
    EXPECT_THROW(ChatReasoner::extractJsonObject("{not: valid}"), ServiceError);
}
