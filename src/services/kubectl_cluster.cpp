#include "causa/kubectl_cluster.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <utility>

#include "causa/logging.hpp"
#include "causa/service_error.hpp"

namespace causa {

namespace {

QMap<QString, QString> resourceMap(const QJsonObject& object) {
    QMap<QString, QString> out;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        out.insert(it.key(), it.value().isString() ? it.value().toString()
                                                   : QString::number(it.value().toDouble()));
    }
    return out;
}

ContainerState parseTerminated(const QJsonObject& terminated) {
    ContainerState state;
    state.kind = "Terminated";
    state.reason = terminated.value("reason").toString();
    state.message = terminated.value("message").toString();
    state.exitCode = terminated.value("exitCode").toInt();
    state.timestamp = terminated.value("finishedAt").toString();
    return state;
}

ContainerState parseState(const QJsonObject& state) {
    if (state.contains("waiting")) {
        const QJsonObject waiting = state.value("waiting").toObject();
        ContainerState out;
        out.kind = "Waiting";
        out.reason = waiting.value("reason").toString();
        out.message = waiting.value("message").toString();
        return out;
    }
    if (state.contains("terminated")) {
        return parseTerminated(state.value("terminated").toObject());
    }
    if (state.contains("running")) {
        ContainerState out;
        out.kind = "Running";
        out.timestamp = state.value("running").toObject().value("startedAt").toString();
        return out;
    }
    return {};
}

QString eventTimestamp(const QJsonObject& event) {
    for (const char* key : {"lastTimestamp", "eventTime", "firstTimestamp"}) {
        const QString value = event.value(key).toString();
        if (!value.isEmpty()) {
            return value;
        }
    }
    return "unknown";
}

}  // namespace

KubectlCluster::KubectlCluster(Settings settings)
    : settings_(std::move(settings)) {}

bool KubectlCluster::isNotFound(const CommandResult& result) {
    return !result.success()
        && (result.stderrText.contains("NotFound") || result.stderrText.contains("not found"));
}

CommandResult KubectlCluster::kubectl(const QStringList& args) const {
    QStringList fullArgs;
    if (!settings_.kubeconfig.isEmpty()) {
        fullArgs << "--kubeconfig" << settings_.kubeconfig;
    }
    fullArgs << args;
    return CommandRunner::run(settings_.program, fullArgs, settings_.timeoutMs);
}

QJsonObject KubectlCluster::kubectlJson(const QStringList& args) const {
    const CommandResult result = kubectl(args);
    if (!result.success()) {
        throw ServiceError(QString("kubectl %1 failed: %2").arg(args.value(0), result.failureText()));
    }
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(result.stdoutText.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ServiceError(QString("kubectl %1 returned invalid JSON: %2").arg(args.value(0), error.errorString()));
    }
    return doc.object();
}

std::optional<QJsonObject> KubectlCluster::fetchPod(const QString& nameSpace, const QString& name) const {
    const QStringList args = {"get", "pod", name, "-n", nameSpace, "-o", "json"};
    const CommandResult result = kubectl(args);
    if (isNotFound(result)) {
        qCInfo(lcCluster) << "Pod" << nameSpace + "/" + name << "not found";
        return std::nullopt;
    }
    if (!result.success()) {
        throw ServiceError("kubectl get pod failed: " + result.failureText());
    }
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(result.stdoutText.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ServiceError("kubectl get pod returned invalid JSON: " + error.errorString());
    }
    return doc.object();
}

std::optional<PodSpec> KubectlCluster::parsePodSpec(const QJsonObject& pod) {
    const QJsonArray containers = pod.value("spec").toObject().value("containers").toArray();
    if (containers.isEmpty()) {
        return std::nullopt;
    }
    const QJsonObject resources = containers.at(0).toObject().value("resources").toObject();
    PodSpec spec;
    spec.limits = resourceMap(resources.value("limits").toObject());
    spec.requests = resourceMap(resources.value("requests").toObject());
    return spec;
}

PodStatus KubectlCluster::parsePodStatus(const QJsonObject& pod) {
    const QJsonObject status = pod.value("status").toObject();
    PodStatus out;
    out.phase = status.value("phase").toString("Unknown");
    for (const QJsonValue& value : status.value("containerStatuses").toArray()) {
        const QJsonObject cs = value.toObject();
        ContainerStatus container;
        container.name = cs.value("name").toString();
        container.ready = cs.value("ready").toBool(false);
        container.restartCount = cs.value("restartCount").toInt();
        container.currentState = parseState(cs.value("state").toObject());
        const QJsonObject lastState = cs.value("lastState").toObject();
        if (lastState.contains("terminated")) {
            container.lastTerminatedState = parseTerminated(lastState.value("terminated").toObject());
        }
        out.containers.append(container);
    }
    return out;
}

QVector<ClusterEvent> KubectlCluster::parseEvents(const QJsonObject& eventList, const QString& podName) {
    QVector<ClusterEvent> out;
    for (const QJsonValue& value : eventList.value("items").toArray()) {
        const QJsonObject event = value.toObject();
        if (event.value("involvedObject").toObject().value("name").toString() != podName) {
            continue;
        }
        ClusterEvent row;
        row.timestamp = eventTimestamp(event);
        row.type = event.value("type").toString();
        row.reason = event.value("reason").toString();
        row.message = event.value("message").toString().trimmed();
        out.append(row);
    }
    return out;
}

QVector<PodRef> KubectlCluster::parsePodList(const QJsonObject& podList) {
    QVector<PodRef> out;
    for (const QJsonValue& value : podList.value("items").toArray()) {
        const QJsonObject metadata = value.toObject().value("metadata").toObject();
        const QString name = metadata.value("name").toString();
        if (name.isEmpty()) {
            continue;
        }
        out.append(PodRef{metadata.value("namespace").toString("default"), name});
    }
    return out;
}

std::optional<PodSpec> KubectlCluster::podSpec(const QString& nameSpace, const QString& name) {
    const std::optional<QJsonObject> pod = fetchPod(nameSpace, name);
    if (!pod.has_value()) {
        return std::nullopt;
    }
    return parsePodSpec(*pod);
}

std::optional<PodStatus> KubectlCluster::podStatus(const QString& nameSpace, const QString& name) {
    const std::optional<QJsonObject> pod = fetchPod(nameSpace, name);
    if (!pod.has_value()) {
        return std::nullopt;
    }
    return parsePodStatus(*pod);
}

QVector<ClusterEvent> KubectlCluster::events(const QString& nameSpace, const QString& podName) {
    return parseEvents(kubectlJson({"get", "events", "-n", nameSpace, "-o", "json"}), podName);
}

QString KubectlCluster::logs(const QString& nameSpace, const QString& name, int tailLines, bool previous) {
    QStringList args = {"logs", name, "-n", nameSpace, QString("--tail=%1").arg(tailLines)};
    if (previous) {
        args << "--previous";
    }
    const CommandResult result = kubectl(args);
    if (!result.success()) {
        throw ServiceError("kubectl logs failed: " + result.failureText());
    }
    return result.stdoutText;
}

QVector<PodRef> KubectlCluster::listPodsByLabel(const QString& labelKey, const QString& labelValue) {
    const QString selector = labelValue.isEmpty() ? labelKey : labelKey + "=" + labelValue;
    return parsePodList(kubectlJson({"get", "pods", "--all-namespaces", "-l", selector, "-o", "json"}));
}

}  // namespace causa
