#include "causa/http_client.hpp"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include "causa/logging.hpp"
#include "causa/telemetry.hpp"

namespace causa {

HttpClient::HttpClient(int timeoutMs)
    : timeoutMs_(timeoutMs) {}

HttpResponse HttpClient::get(const QUrl& url, const Headers& headers) const {
    return send("GET", url, {}, headers);
}

HttpResponse HttpClient::post(const QUrl& url, const QByteArray& body, const Headers& headers) const {
    return send("POST", url, body, headers);
}

HttpResponse HttpClient::send(
    const QByteArray& verb,
    const QUrl& url,
    const QByteArray& body,
    const Headers& headers) const {
    QElapsedTimer elapsed;
    elapsed.start();

    QNetworkRequest request(url);
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        request.setRawHeader(it.key(), it.value());
    }

    // Replies are children of the manager and go away with it.
    QNetworkAccessManager manager;
    QNetworkReply* reply = verb == "POST" ? manager.post(request, body) : manager.get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeoutMs_);
    if (!reply->isFinished()) {
        loop.exec();
    }

    HttpResponse response;
    Telemetry::instance().incrementCounter("http.requests");
    if (!reply->isFinished()) {
        reply->abort();
        response.timedOut = true;
        response.errorText = QString("%1 %2 timed out after %3 ms.")
                                 .arg(QString::fromLatin1(verb), url.toDisplayString())
                                 .arg(timeoutMs_);
        Telemetry::instance().incrementCounter("http.timeouts");
        Telemetry::instance().recordDurationMs("http.duration_ms", elapsed.elapsed());
        qCWarning(lcHttp) << response.errorText;
        return response;
    }

    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        response.errorText = reply->errorString();
    }
    if (!response.success()) {
        Telemetry::instance().incrementCounter("http.failures");
        qCWarning(lcHttp) << verb << url.toDisplayString() << "failed:" << response.status
                          << response.errorText;
    } else {
        qCDebug(lcHttp) << verb << url.toDisplayString() << response.status;
    }
    Telemetry::instance().recordDurationMs("http.duration_ms", elapsed.elapsed());
    return response;
}

}  // namespace causa
