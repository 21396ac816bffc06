#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "causa/http_client.hpp"
#include "causa/reasoning_service.hpp"

namespace causa {

// ReasoningService backed by an OpenAI-compatible chat completions endpoint, one
// model per step.
class ChatReasoner final : public ReasoningService {
public:
    struct Settings {
        QUrl baseUrl = QUrl("http://localhost:8000/v1");
        QString apiKey;
        QString detectorModel = "detector";
        QString rcaModel = "rca";
        QString validatorModel = "validator";
        int timeoutMs = 120000;
    };

    explicit ChatReasoner(Settings settings);

    QString classify(const QString& context) override;
    QString explainRootCause(const QString& anomalyToken, const QString& context) override;
    RcaReport validateAndFormat(const QString& rcaText, const QString& context) override;

    static QJsonObject buildRequest(const QString& model, const QString& systemPrompt, const QString& userPrompt);
    // Content of the first choice; throws ServiceError if there is none.
    static QString messageContent(const QByteArray& responseBody);
    // The outermost {...} object in free text, code fences and prose allowed
    // around it; throws ServiceError if no JSON object can be parsed.
    static QJsonObject extractJsonObject(const QString& text);

private:
    QString complete(const QString& model, const QString& systemPrompt, const QString& userPrompt) const;

    Settings settings_;
    HttpClient http_;
};

}  // namespace causa
