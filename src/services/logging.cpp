#include "causa/logging.hpp"

namespace causa {

Q_LOGGING_CATEGORY(lcMetrics, "causa.metrics")
Q_LOGGING_CATEGORY(lcCollector, "causa.collector")
Q_LOGGING_CATEGORY(lcPipeline, "causa.pipeline")
Q_LOGGING_CATEGORY(lcReasoning, "causa.reasoning")
Q_LOGGING_CATEGORY(lcCluster, "causa.cluster")
Q_LOGGING_CATEGORY(lcHttp, "causa.http")
Q_LOGGING_CATEGORY(lcScanner, "causa.scanner")
Q_LOGGING_CATEGORY(lcConfig, "causa.config")

}  // namespace causa
