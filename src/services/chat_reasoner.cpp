#include "causa/chat_reasoner.hpp"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <utility>

#include "causa/logging.hpp"
#include "causa/service_error.hpp"
#include "causa/telemetry.hpp"

namespace causa {

namespace {

const char* const kDetectorSystemPrompt =
    "You are a specialized anomaly detection model. Analyze the METRICS and POD STATUS data. "
    "Output ONLY the anomaly type or 'HEALTHY'. Example: 'OOM_KILLED'.";

const char* const kAnalystPrompt =
    "You are the Root Cause Analyst. Use all provided context to provide a detailed, reasoned RCA "
    "and proposed fix. Focus heavily on the JFR data.\n\n"
    "ANOMALY TYPE: %1\n"
    "FULL CONTEXT: %2\n\n"
    "Your task: Determine the root cause and propose a solution. Output only the detailed analysis and fix.";

const char* const kValidatorPrompt = R"(You are the Validation Agent. Your task is to validate the RCA output and format it into a structured RcaReport JSON object.

You MUST return a valid JSON object with these EXACT fields:
{
  "title": "Brief title summarizing the issue (e.g., 'OOM Killed - Memory Limit Exceeded')",
  "issue": "Detailed description of what went wrong and why",
  "evidence": "Key metrics, observations, and data points supporting the diagnosis",
  "supportedLogs": ["Array of relevant log entries or patterns"],
  "proposedSolution": "Concrete, actionable steps to fix the issue",
  "validationConfidence": 0.00
}

IMPORTANT:
- Extract the issue description from the RCA output
- Include specific metrics and values in the evidence field
- Provide actionable solutions, not generic advice
- Set validationConfidence between 0.0 and 1.0 based on how confident you are
- If any field is missing from RCA output, infer it from the context

RCA Output to Validate:
%1

Original Context:
%2

Return ONLY the JSON object, no other text.)";

}  // namespace

ChatReasoner::ChatReasoner(Settings settings)
    : settings_(std::move(settings)),
      http_(settings_.timeoutMs) {}

QJsonObject ChatReasoner::buildRequest(
    const QString& model,
    const QString& systemPrompt,
    const QString& userPrompt) {
    QJsonArray messages;
    if (!systemPrompt.isEmpty()) {
        messages.append(QJsonObject{{"role", "system"}, {"content", systemPrompt}});
    }
    messages.append(QJsonObject{{"role", "user"}, {"content", userPrompt}});
    return {
        {"model", model},
        {"messages", messages},
        {"temperature", 0.0},
    };
}

QString ChatReasoner::messageContent(const QByteArray& responseBody) {
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(responseBody, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ServiceError("Chat completion response is not a JSON object: " + error.errorString());
    }
    const QJsonArray choices = doc.object().value("choices").toArray();
    if (choices.isEmpty()) {
        const QString apiError = doc.object().value("error").toObject().value("message").toString();
        throw ServiceError(apiError.isEmpty() ? QString("Chat completion returned no choices.")
                                              : "Chat completion failed: " + apiError);
    }
    const QJsonValue content = choices.at(0).toObject().value("message").toObject().value("content");
    if (!content.isString()) {
        throw ServiceError("Chat completion choice has no message content.");
    }
    return content.toString();
}

QJsonObject ChatReasoner::extractJsonObject(const QString& text) {
    const int start = text.indexOf('{');
    const int end = text.lastIndexOf('}');
    if (start < 0 || end <= start) {
        throw ServiceError("Validator output contains no JSON object.");
    }
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(text.mid(start, end - start + 1).toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ServiceError("Validator output is not valid JSON: " + error.errorString());
    }
    return doc.object();
}

QString ChatReasoner::complete(
    const QString& model,
    const QString& systemPrompt,
    const QString& userPrompt) const {
    QUrl url = settings_.baseUrl;
    QString path = url.path();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    url.setPath(path + "/chat/completions");

    HttpClient::Headers headers;
    headers.insert("Content-Type", "application/json");
    if (!settings_.apiKey.isEmpty()) {
        headers.insert("Authorization", "Bearer " + settings_.apiKey.toUtf8());
    }

    QElapsedTimer elapsed;
    elapsed.start();
    const QByteArray body =
        QJsonDocument(buildRequest(model, systemPrompt, userPrompt)).toJson(QJsonDocument::Compact);
    const HttpResponse response = http_.post(url, body, headers);
    Telemetry::instance().recordDurationMs("reasoning." + model + "_ms", elapsed.elapsed());
    if (!response.success()) {
        Telemetry::instance().incrementCounter("reasoning.failures");
        const QString detail = response.errorText.isEmpty() ? QString::fromUtf8(response.body).left(300)
                                                            : response.errorText;
        throw ServiceError(QString("Model '%1' call failed (HTTP %2): %3").arg(model).arg(response.status).arg(detail));
    }
    return messageContent(response.body);
}

QString ChatReasoner::classify(const QString& context) {
    qCInfo(lcReasoning) << "Classifying context with model" << settings_.detectorModel;
    return complete(settings_.detectorModel, QString::fromUtf8(kDetectorSystemPrompt), context);
}

QString ChatReasoner::explainRootCause(const QString& anomalyToken, const QString& context) {
    qCInfo(lcReasoning) << "Explaining root cause of" << anomalyToken << "with model" << settings_.rcaModel;
    const QString prompt = QString::fromUtf8(kAnalystPrompt).arg(anomalyToken, context);
    return complete(settings_.rcaModel, {}, prompt);
}

RcaReport ChatReasoner::validateAndFormat(const QString& rcaText, const QString& context) {
    qCInfo(lcReasoning) << "Validating root cause analysis with model" << settings_.validatorModel;
    const QString prompt = QString::fromUtf8(kValidatorPrompt).arg(rcaText, context);
    const QString reply = complete(settings_.validatorModel, {}, prompt);
    qCDebug(lcReasoning).noquote() << "Validator reply:\n" << reply;
    return RcaReport::fromJson(extractJsonObject(reply));
}

}  // namespace causa
