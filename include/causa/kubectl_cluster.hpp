#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "causa/collaborators.hpp"
#include "causa/command_runner.hpp"

namespace causa {

// ClusterInfo implemented by shelling out to kubectl and parsing its JSON output.
class KubectlCluster final : public ClusterInfo {
public:
    struct Settings {
        QString program = "kubectl";
        QString kubeconfig;
        int timeoutMs = 15000;
    };

    explicit KubectlCluster(Settings settings);

    std::optional<PodSpec> podSpec(const QString& nameSpace, const QString& name) override;
    std::optional<PodStatus> podStatus(const QString& nameSpace, const QString& name) override;
    QVector<ClusterEvent> events(const QString& nameSpace, const QString& podName) override;
    QString logs(const QString& nameSpace, const QString& name, int tailLines, bool previous) override;
    QVector<PodRef> listPodsByLabel(const QString& labelKey, const QString& labelValue) override;

    static std::optional<PodSpec> parsePodSpec(const QJsonObject& pod);
    static PodStatus parsePodStatus(const QJsonObject& pod);
    static QVector<ClusterEvent> parseEvents(const QJsonObject& eventList, const QString& podName);
    static QVector<PodRef> parsePodList(const QJsonObject& podList);
    static bool isNotFound(const CommandResult& result);

private:
    CommandResult kubectl(const QStringList& args) const;
    QJsonObject kubectlJson(const QStringList& args) const;
    std::optional<QJsonObject> fetchPod(const QString& nameSpace, const QString& name) const;

    Settings settings_;
};

}  // namespace causa
