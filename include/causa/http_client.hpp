#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QUrl>

namespace causa {

struct HttpResponse {
    int status = 0;
    QByteArray body;
    QString errorText;
    bool timedOut = false;

    [[nodiscard]] bool success() const {
        return !timedOut && errorText.isEmpty() && status >= 200 && status < 300;
    }
};

// Blocking HTTP calls on top of QNetworkAccessManager. Each call spins a local
// event loop, so it must run on a thread that owns a Qt event dispatcher.
class HttpClient {
public:
    using Headers = QMap<QByteArray, QByteArray>;

    explicit HttpClient(int timeoutMs = 10000);

    HttpResponse get(const QUrl& url, const Headers& headers = {}) const;
    HttpResponse post(const QUrl& url, const QByteArray& body, const Headers& headers = {}) const;

private:
    HttpResponse send(const QByteArray& verb, const QUrl& url, const QByteArray& body, const Headers& headers) const;

    int timeoutMs_;
};

}  // namespace causa
