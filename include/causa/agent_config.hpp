#pragma once

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

namespace causa {

// Agent settings: defaults, then a JSON file, then CAUSA_* environment
// variables, then command-line options.
struct AgentConfig {
    // Upper bound for scan_interval_s; the watch timer counts milliseconds in an int.
    static constexpr int kMaxScanIntervalSeconds = 24 * 60 * 60;

    QString prometheusUrl = "http://localhost:9090";
    QString cryostatUrl = "http://localhost:8181";
    bool cryostatEnabled = false;
    QString llmUrl = "http://localhost:8000/v1";
    QString llmApiKey;
    QString detectorModel = "detector";
    QString rcaModel = "rca";
    QString validatorModel = "validator";
    QString kubectl = "kubectl";
    QString kubeconfig;
    QString tokenPath = "/var/run/secrets/kubernetes.io/serviceaccount/token";
    int logTailLines = 500;
    int httpTimeoutMs = 10000;
    int llmTimeoutMs = 120000;
    int commandTimeoutMs = 15000;
    QString scanLabel = "causa.io/rca=enabled";
    int scanIntervalSeconds = 300;
    QString logRules;

    void applyJson(const QJsonObject& object);
    QJsonObject loadFromFile(const QString& filePath);
    void applyEnvironment(const QProcessEnvironment& env);

    // Effective settings with the API key masked.
    [[nodiscard]] QJsonObject toJson() const;
};

}  // namespace causa
