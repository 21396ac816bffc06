#pragma once

#include <QString>

#include "causa/rca_report.hpp"

namespace causa {

// The three opaque reasoning steps of an analysis. Implementations may throw
// ServiceError; the pipeline lets it propagate.
class ReasoningService {
public:
    virtual ~ReasoningService() = default;

    // Raw, unsanitized anomaly classification of the full context.
    virtual QString classify(const QString& context) = 0;
    virtual QString explainRootCause(const QString& anomalyToken, const QString& context) = 0;
    virtual RcaReport validateAndFormat(const QString& rcaText, const QString& context) = 0;
};

}  // namespace causa
