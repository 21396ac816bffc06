#pragma once

#include <QString>
#include <QStringList>

#include "causa/rca_report.hpp"

namespace causa {

// Fixed-width box layout of an RcaReport. Every line, borders included, is
// exactly kBoxWidth characters.
class ReportRenderer {
public:
    static constexpr int kBoxWidth = 86;
    static constexpr int kContentWidth = kBoxWidth - 2;
    static constexpr int kTitleMaxLength = 76;
    static constexpr int kConfidenceLabelWidth = 60;
    static constexpr int kMaxWordLength = kContentWidth - 2;

    static QString render(const RcaReport& report);
    static QStringList renderLines(const RcaReport& report);

    // Word-wraps text into bordered lines; words longer than kMaxWordLength are
    // split into kMaxWordLength chunks. Blank text yields a single N/A line.
    // The lead is inserted after the left margin of the first line only.
    static QStringList wrapText(const QString& text, const QString& lead = QString());
    static QString truncate(const QString& text, int maxLength);
};

}  // namespace causa
