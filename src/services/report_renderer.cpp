#include "causa/report_renderer.hpp"

#include <QChar>
#include <QRegularExpression>

#include <cmath>

namespace causa {

namespace {

const QChar kVertical(0x2551);     // ║
const QChar kHorizontal(0x2550);   // ═
const QChar kTopLeft(0x2554);      // ╔
const QChar kTopRight(0x2557);     // ╗
const QChar kJunctionLeft(0x2560); // ╠
const QChar kJunctionRight(0x2563);// ╣
const QChar kBottomLeft(0x255A);   // ╚
const QChar kBottomRight(0x255D);  // ╝
const QChar kBullet(0x2022);       // •

QString rule(QChar left, QChar right) {
    return left + QString(ReportRenderer::kContentWidth, kHorizontal) + right;
}

const QString kBulletIndent = QStringLiteral(" ");

QString lineStart() {
    return QString(kVertical) + ' ';
}

// Pads an open line (starting with the left border) and closes it.
QString closeLine(const QString& open) {
    return open.leftJustified(ReportRenderer::kBoxWidth - 1, ' ', true) + kVertical;
}

QString contentLine(const QString& content) {
    return closeLine(QString(kVertical) + content);
}

QString confidenceText(const RcaReport& report) {
    double value = report.validationConfidence.value_or(0.0);
    if (!std::isfinite(value)) {
        value = 0.0;
    }
    value = qBound(0.0, value, 1.0);
    return QString::number(value, 'f', 2);
}

void appendSection(QStringList& lines, const QString& heading, const QStringList& body) {
    lines.append(rule(kJunctionLeft, kJunctionRight));
    lines.append(contentLine(" " + heading));
    lines.append(body);
}

}  // namespace

QString ReportRenderer::truncate(const QString& text, int maxLength) {
    if (text.size() <= maxLength) {
        return text;
    }
    int cut = maxLength - 3;
    if (cut > 0 && text.at(cut - 1).isHighSurrogate()) {
        cut--;
    }
    return text.left(cut) + "...";
}

QStringList ReportRenderer::wrapText(const QString& text, const QString& lead) {
    static const QRegularExpression whitespace("\\s+");
    const QStringList words = text.split(whitespace, Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return {closeLine(lineStart() + "N/A")};
    }

    const int emptyLength = lineStart().size();
    QStringList lines;
    QString line = lineStart() + lead;
    int contentStart = line.size();
    for (const QString& word : words) {
        if (word.size() > kMaxWordLength) {
            if (line.size() > contentStart) {
                lines.append(closeLine(line));
            }
            line = lineStart();
            contentStart = emptyLength;
            int pos = 0;
            while (pos < word.size()) {
                int chunk = qMin(kMaxWordLength, word.size() - pos);
                // Keep surrogate pairs on one line.
                if (pos + chunk < word.size() && word.at(pos + chunk - 1).isHighSurrogate()) {
                    chunk--;
                }
                lines.append(closeLine(lineStart() + word.mid(pos, chunk)));
                pos += chunk;
            }
            continue;
        }

        if (line.size() > contentStart && line.size() + word.size() + 1 >= kBoxWidth - 1) {
            lines.append(closeLine(line));
            line = lineStart();
            contentStart = emptyLength;
        }
        line += word;
        line += ' ';
    }

    if (line.size() > contentStart) {
        lines.append(closeLine(line));
    }
    return lines;
}

QStringList ReportRenderer::renderLines(const RcaReport& report) {
    QString title = report.title.simplified();
    if (title.isEmpty()) {
        title = "N/A";
    }

    QStringList lines;
    lines.append(rule(kTopLeft, kTopRight));
    lines.append(contentLine(QString(27, ' ') + "RCA REPORT"));
    lines.append(rule(kJunctionLeft, kJunctionRight));
    lines.append(contentLine(" Title: " + truncate(title, kTitleMaxLength).leftJustified(kTitleMaxLength)));

    appendSection(lines, "Issue Description:", wrapText(report.issue));
    appendSection(lines, "Evidence:", wrapText(report.evidence));
    appendSection(lines, "Proposed Solution:", wrapText(report.proposedSolution));

    if (!report.supportedLogs.isEmpty()) {
        QStringList logLines;
        for (const QString& log : report.supportedLogs) {
            logLines.append(wrapText(QString(kBullet) + ' ' + log, kBulletIndent));
        }
        appendSection(lines, "Supported Logs:", logLines);
    }

    lines.append(rule(kJunctionLeft, kJunctionRight));
    lines.append(contentLine(
        " Validation Confidence: " + confidenceText(report).leftJustified(kConfidenceLabelWidth)));
    lines.append(rule(kBottomLeft, kBottomRight));
    return lines;
}

QString ReportRenderer::render(const RcaReport& report) {
    return renderLines(report).join('\n') + '\n';
}

}  // namespace causa
