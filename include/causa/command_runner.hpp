#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

namespace causa {

struct CommandResult {
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    bool timedOut = false;

    [[nodiscard]] bool success() const { return !timedOut && exitCode == 0; }
    // First non-empty of stderr, stdout or a generic exit-code message.
    [[nodiscard]] QString failureText() const;
};

class CommandRunner {
public:
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 15000,
        const QMap<QString, QString>& extraEnv = {});
};

}  // namespace causa
