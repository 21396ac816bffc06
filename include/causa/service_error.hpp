#pragma once

#include <QString>

#include <stdexcept>

namespace causa {

// Raised by collaborators and reasoning services when their backend cannot be
// reached or answers with something unusable.
class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const QString& message)
        : std::runtime_error(message.toStdString()) {}

    [[nodiscard]] QString message() const { return QString::fromStdString(what()); }
};

}  // namespace causa
