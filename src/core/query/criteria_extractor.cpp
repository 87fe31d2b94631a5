#include "core/query/criteria_extractor.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <initializer_list>

namespace pa {

namespace {

bool containsAny(const QString& lower, const std::initializer_list<const char*>& needles)
{
    for (const char* needle : needles) {
        if (lower.contains(QString::fromLatin1(needle))) {
            return true;
        }
    }
    return false;
}

} // namespace

QueryAnalysis CriteriaExtractor::classify(const QString& text)
{
    QueryAnalysis analysis;
    analysis.originalQuery = text;

    const QString lower = text.toLower();
    analysis.intent = detectIntent(lower);
    analysis.criteria.priceMax = extractPriceMax(lower);
    analysis.criteria.focus = detectFocus(lower);

    LOG_DEBUG(paQuery, "classify: intent=%s focus=%s priceMax=%.2f",
              qUtf8Printable(intentToString(analysis.intent)),
              qUtf8Printable(focusToString(analysis.criteria.effectiveFocus())),
              analysis.criteria.priceMax.value_or(-1.0));
    return analysis;
}

Intent CriteriaExtractor::detectIntent(const QString& lowerText)
{
    if (containsAny(lowerText, {"compare", "versus", "vs", "difference", "better"})) {
        return Intent::Comparison;
    }
    if (containsAny(lowerText, {"best", "recommend", "which", "should i", "top"})) {
        return Intent::Recommendation;
    }
    if (containsAny(lowerText, {"spec", "feature", "detail", "what is", "what are",
                                "tell me about"})) {
        return Intent::Specs;
    }
    return Intent::General;
}

std::optional<double> CriteriaExtractor::extractPriceMax(const QString& lowerText)
{
    static const QRegularExpression underPattern(QStringLiteral(R"(under\s*\$?(\d+))"));
    static const QRegularExpression belowPattern(QStringLiteral(R"(below\s*\$?(\d+))"));

    std::optional<double> priceMax;
    for (const QRegularExpression* pattern : {&underPattern, &belowPattern}) {
        const QRegularExpressionMatch match = pattern->match(lowerText);
        if (!match.hasMatch()) {
            continue;
        }
        bool ok = false;
        const double value = match.captured(1).toDouble(&ok);
        if (ok) {
            priceMax = value;
        }
    }
    return priceMax;
}

std::optional<Focus> CriteriaExtractor::detectFocus(const QString& lowerText)
{
    std::optional<Focus> focus;
    if (containsAny(lowerText, {"battery", "long lasting"})) {
        focus = Focus::Battery;
    }
    if (containsAny(lowerText, {"camera", "photo", "photography"})) {
        focus = Focus::Camera;
    }
    if (containsAny(lowerText, {"display", "screen"})) {
        focus = Focus::Display;
    }
    return focus;
}

} // namespace pa
