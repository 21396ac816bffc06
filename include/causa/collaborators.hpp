#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

#include <optional>

namespace causa {

// Resource limits and requests of a pod's primary container.
struct PodSpec {
    QMap<QString, QString> limits;
    QMap<QString, QString> requests;
};

struct ContainerState {
    QString kind;  // Running, Waiting or Terminated; empty when unknown
    QString reason;
    QString message;
    int exitCode = 0;
    QString timestamp;
};

struct ContainerStatus {
    QString name;
    bool ready = false;
    int restartCount = 0;
    ContainerState currentState;
    std::optional<ContainerState> lastTerminatedState;
};

struct PodStatus {
    QString phase;
    QVector<ContainerStatus> containers;
};

struct ClusterEvent {
    QString timestamp;
    QString type;
    QString reason;
    QString message;
};

struct PodRef {
    QString nameSpace;
    QString name;
};

// Every method may throw ServiceError when the cluster cannot be queried.
class ClusterInfo {
public:
    virtual ~ClusterInfo() = default;

    virtual std::optional<PodSpec> podSpec(const QString& nameSpace, const QString& name) = 0;
    virtual std::optional<PodStatus> podStatus(const QString& nameSpace, const QString& name) = 0;
    virtual QVector<ClusterEvent> events(const QString& nameSpace, const QString& podName) = 0;
    virtual QString logs(const QString& nameSpace, const QString& name, int tailLines, bool previous) = 0;
    virtual QVector<PodRef> listPodsByLabel(const QString& labelKey, const QString& labelValue) = 0;
};

// Returns the Prometheus HTTP API response body for an instant query.
class MetricsBackend {
public:
    virtual ~MetricsBackend() = default;

    virtual QJsonObject query(const QString& expr) = 0;
};

class ProfilingBackend {
public:
    virtual ~ProfilingBackend() = default;

    virtual QString report(const QString& target) = 0;
};

}  // namespace causa
