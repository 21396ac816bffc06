#pragma once

#include <QMutex>
#include <QString>

namespace causa {

// Reads the service-account bearer token on first use and keeps it for the life
// of the process. Safe to share between concurrent analyses.
class TokenProvider {
public:
    static constexpr const char* kDefaultTokenPath =
        "/var/run/secrets/kubernetes.io/serviceaccount/token";

    explicit TokenProvider(QString tokenPath = QString::fromLatin1(kDefaultTokenPath));

    // "Bearer <token>", or empty while no token could be read.
    [[nodiscard]] QString authorization() const;

private:
    QString tokenPath_;
    mutable QMutex mutex_;
    mutable QString cached_;
    mutable bool loaded_ = false;
};

}  // namespace causa
