#include "causa/agent_config.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include "causa/logging.hpp"

namespace causa {

namespace {

void readString(const QJsonObject& object, const char* key, QString& target) {
    const QJsonValue value = object.value(key);
    if (value.isString()) {
        target = value.toString();
    }
}

void readInt(const QJsonObject& object, const char* key, int& target) {
    const QJsonValue value = object.value(key);
    if (value.isDouble() && value.toInt(-1) > 0) {
        target = value.toInt();
    }
}

void readBool(const QJsonObject& object, const char* key, bool& target) {
    const QJsonValue value = object.value(key);
    if (value.isBool()) {
        target = value.toBool();
    }
}

bool parseFlag(const QString& text) {
    const QString lower = text.trimmed().toLower();
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

}  // namespace

void AgentConfig::applyJson(const QJsonObject& object) {
    readString(object, "prometheus_url", prometheusUrl);
    readString(object, "cryostat_url", cryostatUrl);
    readBool(object, "cryostat_enabled", cryostatEnabled);
    readString(object, "llm_url", llmUrl);
    readString(object, "llm_api_key", llmApiKey);
    readString(object, "detector_model", detectorModel);
    readString(object, "rca_model", rcaModel);
    readString(object, "validator_model", validatorModel);
    readString(object, "kubectl", kubectl);
    readString(object, "kubeconfig", kubeconfig);
    readString(object, "token_path", tokenPath);
    readInt(object, "log_tail_lines", logTailLines);
    readInt(object, "http_timeout_ms", httpTimeoutMs);
    readInt(object, "llm_timeout_ms", llmTimeoutMs);
    readInt(object, "command_timeout_ms", commandTimeoutMs);
    readString(object, "scan_label", scanLabel);
    readInt(object, "scan_interval_s", scanIntervalSeconds);
    scanIntervalSeconds = qMin(scanIntervalSeconds, kMaxScanIntervalSeconds);
    readString(object, "log_rules", logRules);
}

QJsonObject AgentConfig::loadFromFile(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open config file."},
            {"path", filePath},
        };
    }

    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    file.close();
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return {
            {"success", false},
            {"error", "Config file must contain a JSON object: " + error.errorString()},
            {"path", filePath},
        };
    }

    applyJson(doc.object());
    qCInfo(lcConfig) << "Loaded config from" << filePath;
    return {
        {"success", true},
        {"path", filePath},
    };
}

void AgentConfig::applyEnvironment(const QProcessEnvironment& env) {
    if (env.contains("CAUSA_PROMETHEUS_URL")) {
        prometheusUrl = env.value("CAUSA_PROMETHEUS_URL");
    }
    if (env.contains("CAUSA_CRYOSTAT_URL")) {
        cryostatUrl = env.value("CAUSA_CRYOSTAT_URL");
    }
    if (env.contains("CAUSA_CRYOSTAT_ENABLED")) {
        cryostatEnabled = parseFlag(env.value("CAUSA_CRYOSTAT_ENABLED"));
    }
    if (env.contains("CAUSA_LLM_URL")) {
        llmUrl = env.value("CAUSA_LLM_URL");
    }
    if (env.contains("CAUSA_LLM_API_KEY")) {
        llmApiKey = env.value("CAUSA_LLM_API_KEY");
    }
    if (env.contains("CAUSA_SCAN_LABEL")) {
        scanLabel = env.value("CAUSA_SCAN_LABEL");
    }
}

QJsonObject AgentConfig::toJson() const {
    return {
        {"prometheus_url", prometheusUrl},
        {"cryostat_url", cryostatUrl},
        {"cryostat_enabled", cryostatEnabled},
        {"llm_url", llmUrl},
        {"llm_api_key", llmApiKey.isEmpty() ? QString() : QString("***")},
        {"detector_model", detectorModel},
        {"rca_model", rcaModel},
        {"validator_model", validatorModel},
        {"kubectl", kubectl},
        {"kubeconfig", kubeconfig},
        {"token_path", tokenPath},
        {"log_tail_lines", logTailLines},
        {"http_timeout_ms", httpTimeoutMs},
        {"llm_timeout_ms", llmTimeoutMs},
        {"command_timeout_ms", commandTimeoutMs},
        {"scan_label", scanLabel},
        {"scan_interval_s", scanIntervalSeconds},
        {"log_rules", logRules},
    };
}

}  // namespace causa
