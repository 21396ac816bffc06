#include "causa/metrics_backends.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

#include <utility>

#include "causa/logging.hpp"
#include "causa/service_error.hpp"
#include "causa/token_provider.hpp"

namespace causa {

namespace {

QUrl withPath(QUrl base, const QString& suffix) {
    QString path = base.path();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    base.setPath(path + suffix, QUrl::TolerantMode);
    return base;
}

HttpClient::Headers authHeaders(const TokenProvider* tokens) {
    HttpClient::Headers headers;
    if (tokens != nullptr) {
        const QString auth = tokens->authorization();
        if (!auth.isEmpty()) {
            headers.insert("Authorization", auth.toUtf8());
        }
    }
    return headers;
}

QString failureDetail(const HttpResponse& response) {
    if (!response.errorText.isEmpty()) {
        return response.errorText;
    }
    return QString::fromUtf8(response.body).trimmed().left(300);
}

}  // namespace

PrometheusBackend::PrometheusBackend(QUrl baseUrl, const TokenProvider* tokens, int timeoutMs)
    : baseUrl_(std::move(baseUrl)),
      tokens_(tokens),
      http_(timeoutMs) {}

QUrl PrometheusBackend::queryUrl(const QUrl& baseUrl, const QString& expr) {
    QUrl url = withPath(baseUrl, "/api/v1/query");
    url.setQuery("query=" + QString::fromLatin1(QUrl::toPercentEncoding(expr)), QUrl::StrictMode);
    return url;
}

QJsonObject PrometheusBackend::query(const QString& expr) {
    qCDebug(lcMetrics) << "PromQL:" << expr;
    const HttpResponse response = http_.get(queryUrl(baseUrl_, expr), authHeaders(tokens_));
    if (!response.success()) {
        throw ServiceError(QString("Prometheus query failed (HTTP %1): %2")
                               .arg(response.status)
                               .arg(failureDetail(response)));
    }
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ServiceError("Prometheus returned invalid JSON: " + error.errorString());
    }
    return doc.object();
}

CryostatBackend::CryostatBackend(QUrl baseUrl, const TokenProvider* tokens, int timeoutMs)
    : baseUrl_(std::move(baseUrl)),
      tokens_(tokens),
      http_(timeoutMs) {}

QUrl CryostatBackend::reportUrl(const QUrl& baseUrl, const QString& target) {
    const QString encoded = QString::fromLatin1(QUrl::toPercentEncoding(target));
    return withPath(baseUrl, "/api/v1/targets/" + encoded + "/reports");
}

QString CryostatBackend::report(const QString& target) {
    qCInfo(lcCollector) << "Fetching JFR analysis from Cryostat for" << target;
    const HttpResponse response = http_.get(reportUrl(baseUrl_, target), authHeaders(tokens_));
    if (!response.success()) {
        throw ServiceError(QString("Cryostat report request failed (HTTP %1): %2")
                               .arg(response.status)
                               .arg(failureDetail(response)));
    }
    return QString::fromUtf8(response.body);
}

}  // namespace causa
