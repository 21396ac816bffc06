#pragma once

#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "causa/collaborators.hpp"
#include "causa/http_client.hpp"

namespace causa {

class TokenProvider;

// Instant queries against the Prometheus HTTP API.
class PrometheusBackend final : public MetricsBackend {
public:
    PrometheusBackend(QUrl baseUrl, const TokenProvider* tokens, int timeoutMs = 10000);

    QJsonObject query(const QString& expr) override;

    static QUrl queryUrl(const QUrl& baseUrl, const QString& expr);

private:
    QUrl baseUrl_;
    const TokenProvider* tokens_;
    HttpClient http_;
};

// Automated JFR analysis reports from Cryostat.
class CryostatBackend final : public ProfilingBackend {
public:
    CryostatBackend(QUrl baseUrl, const TokenProvider* tokens, int timeoutMs = 30000);

    QString report(const QString& target) override;

    static QUrl reportUrl(const QUrl& baseUrl, const QString& target);

private:
    QUrl baseUrl_;
    const TokenProvider* tokens_;
    HttpClient http_;
};

}  // namespace causa
