#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QTextStream>
#include <QTimer>
#include <QUrl>

#include <exception>

#include "causa/agent_config.hpp"
#include "causa/chat_reasoner.hpp"
#include "causa/context_aggregator.hpp"
#include "causa/diagnostic_pipeline.hpp"
#include "causa/kubectl_cluster.hpp"
#include "causa/metric_summarizer.hpp"
#include "causa/metrics_backends.hpp"
#include "causa/logging.hpp"
#include "causa/report_renderer.hpp"
#include "causa/scan_scheduler.hpp"
#include "causa/telemetry.hpp"
#include "causa/token_provider.hpp"
#include "causa/workload_scanner.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kFirstScanDelayMs = 10000;

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

// Everything one analysis needs, wired once per process.
struct Agent {
    explicit Agent(const causa::AgentConfig& config)
        : tokens(config.tokenPath),
          cluster({config.kubectl, config.kubeconfig, config.commandTimeoutMs}),
          prometheus(QUrl(config.prometheusUrl), &tokens, config.httpTimeoutMs),
          cryostat(QUrl(config.cryostatUrl), &tokens, config.httpTimeoutMs * 3),
          summarizer(&cluster, &prometheus),
          aggregator(&cluster, &summarizer, config.cryostatEnabled ? &cryostat : nullptr, config.logTailLines),
          reasoner({QUrl(config.llmUrl),
                    config.llmApiKey,
                    config.detectorModel,
                    config.rcaModel,
                    config.validatorModel,
                    config.llmTimeoutMs}),
          pipeline(&aggregator, &reasoner),
          scanner(&cluster, &pipeline) {}

    causa::TokenProvider tokens;
    causa::KubectlCluster cluster;
    causa::PrometheusBackend prometheus;
    causa::CryostatBackend cryostat;
    causa::MetricSummarizer summarizer;
    causa::ContextAggregator aggregator;
    causa::ChatReasoner reasoner;
    causa::DiagnosticPipeline pipeline;
    causa::WorkloadScanner scanner;
};

int runAnalyze(Agent& agent, const QString& nameSpace, const QString& pod, bool json) {
    try {
        const causa::RcaReport report = agent.pipeline.run(nameSpace, pod);
        if (json) {
            out() << QJsonDocument(report.toJson()).toJson(QJsonDocument::Indented);
        } else {
            out() << causa::ReportRenderer::render(report);
        }
        out().flush();
        return kExitOk;
    } catch (const std::exception& e) {
        err() << "Analysis of " << nameSpace << "/" << pod << " failed: " << e.what() << "\n";
        err().flush();
        return kExitFailure;
    }
}

int runScan(Agent& agent, const QString& label) {
    const QJsonObject summary = agent.scanner.scan(label, [](const causa::PodRef& pod, const causa::RcaReport& report) {
        out() << pod.nameSpace << "/" << pod.name << "\n" << causa::ReportRenderer::render(report);
        out().flush();
    });
    if (!summary.value("success").toBool(false)) {
        err() << "Scan failed: " << summary.value("error").toString() << "\n";
        err().flush();
        return kExitFailure;
    }
    out() << QString("Scan of '%1' finished: %2 analyzed, %3 failed.\n")
                 .arg(label)
                 .arg(summary.value("succeeded_count").toInt())
                 .arg(summary.value("failed_count").toInt());
    out().flush();
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("causa");
    app.setApplicationVersion("0.1.0");
    QObject::connect(&app, &QCoreApplication::aboutToQuit, []() {
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        const QJsonObject result = causa::Telemetry::instance().exportToFile(path);
        if (!result.value("success").toBool(false)) {
            err() << "Telemetry export failed: " << result.value("error").toString() << "\n";
            err().flush();
        }
    });

    QCommandLineParser parser;
    parser.setApplicationDescription("Root cause analysis agent for failing Kubernetes workloads.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "analyze | scan | watch");

    const QCommandLineOption configOpt("config", "JSON config file.", "path");
    const QCommandLineOption namespaceOpt({"n", "namespace"}, "Namespace of the pod.", "namespace", "default");
    const QCommandLineOption podOpt({"p", "pod"}, "Pod to analyze.", "pod");
    const QCommandLineOption jsonOpt("json", "Print the report as JSON instead of a box.");
    const QCommandLineOption labelOpt({"l", "label"}, "Pod label selector key=value for scans.", "label");
    const QCommandLineOption intervalOpt("interval", "Seconds between scans in watch mode.", "seconds");
    const QCommandLineOption verboseOpt({"v", "verbose"}, "Enable debug logging.");
    const QCommandLineOption prometheusOpt("prometheus-url", "Prometheus base URL.", "url");
    const QCommandLineOption cryostatOpt("cryostat-url", "Cryostat base URL.", "url");
    const QCommandLineOption profilingOpt("enable-profiling", "Include Cryostat JFR analysis.");
    const QCommandLineOption llmOpt("llm-url", "OpenAI-compatible API base URL.", "url");
    const QCommandLineOption kubectlOpt("kubectl", "kubectl executable.", "path");
    const QCommandLineOption kubeconfigOpt("kubeconfig", "kubeconfig file passed to kubectl.", "path");
    parser.addOptions({configOpt, namespaceOpt, podOpt, jsonOpt, labelOpt, intervalOpt, verboseOpt,
                       prometheusOpt, cryostatOpt, profilingOpt, llmOpt, kubectlOpt, kubeconfigOpt});
    parser.process(app);

    causa::AgentConfig config;
    const QString configPath = parser.isSet(configOpt) ? parser.value(configOpt)
                                                       : QDir(QDir::currentPath()).filePath("causa.json");
    if (parser.isSet(configOpt) || QFile::exists(configPath)) {
        const QJsonObject loaded = config.loadFromFile(configPath);
        if (!loaded.value("success").toBool(false)) {
            err() << loaded.value("error").toString() << " (" << configPath << ")\n";
            return kExitUsage;
        }
    }
    config.applyEnvironment(QProcessEnvironment::systemEnvironment());
    if (parser.isSet(prometheusOpt)) {
        config.prometheusUrl = parser.value(prometheusOpt);
    }
    if (parser.isSet(cryostatOpt)) {
        config.cryostatUrl = parser.value(cryostatOpt);
    }
    if (parser.isSet(profilingOpt)) {
        config.cryostatEnabled = true;
    }
    if (parser.isSet(llmOpt)) {
        config.llmUrl = parser.value(llmOpt);
    }
    if (parser.isSet(kubectlOpt)) {
        config.kubectl = parser.value(kubectlOpt);
    }
    if (parser.isSet(kubeconfigOpt)) {
        config.kubeconfig = parser.value(kubeconfigOpt);
    }
    if (parser.isSet(labelOpt)) {
        config.scanLabel = parser.value(labelOpt);
    }
    if (parser.isSet(intervalOpt)) {
        bool ok = false;
        const int seconds = parser.value(intervalOpt).toInt(&ok);
        if (!ok || seconds <= 0) {
            err() << "--interval must be a positive number of seconds.\n";
            return kExitUsage;
        }
        config.scanIntervalSeconds = qMin(seconds, causa::AgentConfig::kMaxScanIntervalSeconds);
    }

    QString rules = config.logRules;
    if (parser.isSet(verboseOpt)) {
        rules += (rules.isEmpty() ? "" : "\n") + QString("causa.*.debug=true");
    }
    if (!rules.isEmpty()) {
        QLoggingCategory::setFilterRules(rules);
    }

    qCDebug(causa::lcConfig).noquote() << "Effective configuration:"
                                       << QJsonDocument(config.toJson()).toJson(QJsonDocument::Compact);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err() << "Expected exactly one command: analyze, scan or watch.\n";
        return kExitUsage;
    }
    const QString command = positional.first();
    if (command == "analyze" && (!parser.isSet(podOpt) || parser.value(podOpt).trimmed().isEmpty())) {
        err() << "Pod name is required (--pod).\n";
        return kExitUsage;
    }
    if (command != "analyze" && command != "scan" && command != "watch") {
        err() << "Unknown command '" << command << "'.\n";
        return kExitUsage;
    }

    Agent agent(config);

    if (command == "watch") {
        causa::ScanScheduler scheduler(
            [&agent, &config]() { runScan(agent, config.scanLabel); },
            config.scanIntervalSeconds * 1000,
            kFirstScanDelayMs);
        scheduler.start();
        out() << "Watching pods labelled '" << config.scanLabel << "' every " << config.scanIntervalSeconds
              << " s.\n";
        out().flush();
        return QCoreApplication::exec();
    }

    QTimer::singleShot(0, &app, [&]() {
        const int code = command == "analyze"
            ? runAnalyze(agent, parser.value(namespaceOpt), parser.value(podOpt).trimmed(), parser.isSet(jsonOpt))
            : runScan(agent, config.scanLabel);
        QCoreApplication::exit(code);
    });
    return QCoreApplication::exec();
}
