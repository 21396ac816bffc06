#include "causa/command_runner.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QProcessEnvironment>

#include "causa/logging.hpp"
#include "causa/telemetry.hpp"

namespace causa {

QString CommandResult::failureText() const {
    if (timedOut && stderrText.trimmed().isEmpty()) {
        return "Command timed out.";
    }
    const QString err = stderrText.trimmed();
    if (!err.isEmpty()) {
        return err;
    }
    const QString out = stdoutText.trimmed();
    if (!out.isEmpty()) {
        return out;
    }
    return QString("Command exited with code %1.").arg(exitCode);
}

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs,
    const QMap<QString, QString>& extraEnv) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (auto it = extraEnv.constBegin(); it != extraEnv.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }

    process.setProcessEnvironment(env);
    qCDebug(lcCluster) << "exec" << program << args;
    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(timeoutMs)) {
        result.timedOut = true;
        result.stderrText = QString("Failed to start %1.").arg(program);
        Telemetry::instance().incrementCounter("commands.start_failures");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.timedOut = true;
        result.stderrText = "Command timed out.";
        Telemetry::instance().incrementCounter("commands.timeouts");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    Telemetry::instance().incrementCounter("commands.count");
    if (result.exitCode != 0) {
        Telemetry::instance().incrementCounter("commands.non_zero_exit");
    }
    Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
    return result;
}

}  // namespace causa
