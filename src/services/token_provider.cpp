#include "causa/token_provider.hpp"

#include <QFile>
#include <QMutexLocker>

#include <utility>

#include "causa/logging.hpp"

namespace causa {

TokenProvider::TokenProvider(QString tokenPath)
    : tokenPath_(std::move(tokenPath)) {}

QString TokenProvider::authorization() const {
    QMutexLocker lock(&mutex_);
    if (loaded_) {
        return cached_;
    }

    QFile file(tokenPath_);
    if (!file.exists()) {
        qCWarning(lcConfig) << "Service account token not found at" << tokenPath_ << "- using no token.";
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcConfig) << "Failed to read service account token:" << file.errorString();
        return {};
    }
    const QString token = QString::fromUtf8(file.readAll()).trimmed();
    file.close();
    if (token.isEmpty()) {
        qCWarning(lcConfig) << "Service account token file" << tokenPath_ << "is empty.";
        return {};
    }

    cached_ = "Bearer " + token;
    loaded_ = true;
    qCInfo(lcConfig) << "Service account token loaded.";
    return cached_;
}

}  // namespace causa
