#include "core/ranking/spec_parser.h"

#include <QRegularExpression>

namespace pa {

namespace {

std::optional<int> firstInteger(const QRegularExpression& pattern, const QString& text)
{
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const int value = match.captured(1).toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> amountAfter(const QRegularExpression& pattern, const QString& text)
{
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    QString digits = match.captured(1);
    digits.remove(QLatin1Char(','));
    bool ok = false;
    const double value = digits.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

} // namespace

bool SpecParser::isBlank(const QString& text)
{
    const QString trimmed = text.trimmed();
    return trimmed.isEmpty() || trimmed.compare(QLatin1String("N/A"), Qt::CaseInsensitive) == 0;
}

std::optional<int> SpecParser::batteryMah(const QString& battery)
{
    if (isBlank(battery)) {
        return std::nullopt;
    }
    static const QRegularExpression kPattern(
        QStringLiteral(R"((\d+)\s*mAh)"), QRegularExpression::CaseInsensitiveOption);
    return firstInteger(kPattern, battery);
}

std::optional<int> SpecParser::cameraMegapixels(const QString& camera)
{
    if (isBlank(camera)) {
        return std::nullopt;
    }
    static const QRegularExpression kPattern(
        QStringLiteral(R"((\d+)\s*MP)"), QRegularExpression::CaseInsensitiveOption);
    return firstInteger(kPattern, camera);
}

std::optional<int> SpecParser::ramGigabytes(const QString& ram)
{
    if (isBlank(ram)) {
        return std::nullopt;
    }
    static const QRegularExpression kPattern(
        QStringLiteral(R"((\d+)\s*GB)"), QRegularExpression::CaseInsensitiveOption);
    return firstInteger(kPattern, ram);
}

std::optional<double> SpecParser::priceUsd(const QString& price)
{
    if (isBlank(price)) {
        return std::nullopt;
    }
    static const QRegularExpression kUsd(QStringLiteral(R"(\$\s*([\d,]+\.?\d*))"));
    static const QRegularExpression kEur(QStringLiteral(R"(€\s*([\d,]+\.?\d*))"));

    if (auto usd = amountAfter(kUsd, price)) {
        return usd;
    }
    return amountAfter(kEur, price);
}

bool SpecParser::mentionsHighRefresh(const QString& display)
{
    static const QRegularExpression kPattern(
        QStringLiteral(R"(120\s*hz)"), QRegularExpression::CaseInsensitiveOption);
    return kPattern.match(display).hasMatch();
}

bool SpecParser::mentionsAmoled(const QString& display)
{
    return display.contains(QLatin1String("amoled"), Qt::CaseInsensitive);
}

} // namespace pa
