#include "core/query/model_name_rules.h"

#include <QRegularExpression>

namespace pa {

namespace {

const QRegularExpression& seriesTokenPattern()
{
    static const QRegularExpression kPattern(QStringLiteral(R"(^[sazn]\d+$)"));
    return kPattern;
}

// Applied to space-joined tokens starting at a candidate position. The
// trailing group keeps matches on token boundaries.
const QRegularExpression& foldPattern()
{
    static const QRegularExpression kPattern(
        QStringLiteral(R"(^z ?(fold|flip) ?(\d+)? ?(fe|special)?(?: |$))"));
    return kPattern;
}

ModelNameRules::FoldName foldFromMatch(const QRegularExpressionMatch& match)
{
    ModelNameRules::FoldName fold;
    fold.series = match.captured(1);
    fold.generation = match.captured(2);
    fold.variant = match.captured(3);
    return fold;
}

} // namespace

bool ModelNameRules::isSuffixToken(const QString& token)
{
    return token == QLatin1String("ultra")
        || token == QLatin1String("plus")
        || token == QLatin1String("+")
        || token == QLatin1String("fe");
}

QString ModelNameRules::canonicalSuffix(const QString& token)
{
    if (token == QLatin1String("+")) {
        return QStringLiteral("plus");
    }
    return token;
}

std::optional<ModelNameRules::SeriesName> ModelNameRules::parseSeriesName(const QStringList& coreTokens)
{
    if (coreTokens.isEmpty() || coreTokens.size() > 2) {
        return std::nullopt;
    }
    if (!seriesTokenPattern().match(coreTokens.first()).hasMatch()) {
        return std::nullopt;
    }

    SeriesName name;
    name.modelToken = coreTokens.first();
    if (coreTokens.size() == 2) {
        if (!isSuffixToken(coreTokens.at(1))) {
            return std::nullopt;
        }
        name.suffix = canonicalSuffix(coreTokens.at(1));
    }
    return name;
}

std::vector<ModelNameRules::SeriesMention> ModelNameRules::findSeriesMentions(
    const QStringList& queryTokens, const QString& modelToken)
{
    std::vector<SeriesMention> mentions;
    for (int i = 0; i < queryTokens.size(); ++i) {
        if (queryTokens[i] != modelToken) {
            continue;
        }
        SeriesMention mention;
        mention.tokenIndex = i;
        if (i + 1 < queryTokens.size() && isSuffixToken(queryTokens[i + 1])) {
            mention.suffix = canonicalSuffix(queryTokens[i + 1]);
        }
        mentions.push_back(mention);
    }
    return mentions;
}

std::optional<ModelNameRules::FoldName> ModelNameRules::parseFoldName(const QStringList& coreTokens)
{
    const QString joined = coreTokens.join(QLatin1Char(' '));
    const QRegularExpressionMatch match = foldPattern().match(joined);
    // The whole name has to be consumed.
    if (!match.hasMatch() || match.capturedEnd(0) < joined.size()) {
        return std::nullopt;
    }
    return foldFromMatch(match);
}

std::optional<ModelNameRules::FoldName> ModelNameRules::findFoldMention(
    const QStringList& queryTokens, const QString& series)
{
    for (int i = 0; i < queryTokens.size(); ++i) {
        if (!queryTokens[i].startsWith(QLatin1Char('z'))) {
            continue;
        }
        const QString joined = queryTokens.mid(i).join(QLatin1Char(' '));
        const QRegularExpressionMatch match = foldPattern().match(joined);
        if (match.hasMatch() && match.captured(1) == series) {
            return foldFromMatch(match);
        }
    }
    return std::nullopt;
}

} // namespace pa
