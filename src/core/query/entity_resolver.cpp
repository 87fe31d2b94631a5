#include "core/query/entity_resolver.h"
#include "core/query/model_name_rules.h"
#include "core/query/query_tokenizer.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>

namespace pa {

namespace {

const QStringList& brandTokens()
{
    static const QStringList kTokens = {QStringLiteral("samsung")};
    return kTokens;
}

const QStringList& lineTokens()
{
    static const QStringList kTokens = {QStringLiteral("galaxy")};
    return kTokens;
}

bool nameHasSuffix(const QStringList& nameTokens, const QString& canonicalSuffix)
{
    for (const QString& token : nameTokens) {
        if (ModelNameRules::isSuffixToken(token)
            && ModelNameRules::canonicalSuffix(token) == canonicalSuffix) {
            return true;
        }
    }
    return false;
}

// The name's tokens appear contiguously in the query and are not directly
// followed by a suffix the name itself lacks ("s24" must not match "s24 ultra").
bool containsWholeName(const QStringList& queryTokens, const QStringList& nameTokens)
{
    if (nameTokens.isEmpty()) {
        return false;
    }

    int from = 0;
    while (true) {
        const int at = QueryTokenizer::indexOfSequence(queryTokens, nameTokens, from);
        if (at < 0) {
            return false;
        }

        const int next = at + static_cast<int>(nameTokens.size());
        const bool followedBySuffix = next < queryTokens.size()
            && ModelNameRules::isSuffixToken(queryTokens[next])
            && !nameHasSuffix(nameTokens,
                              ModelNameRules::canonicalSuffix(queryTokens[next]));
        if (!followedBySuffix) {
            return true;
        }
        from = at + 1;
    }
}

std::optional<int> seriesConfidence(const QStringList& queryTokens,
                                    const ModelNameRules::SeriesName& series)
{
    const auto mentions = ModelNameRules::findSeriesMentions(queryTokens, series.modelToken);
    for (const auto& mention : mentions) {
        if (mention.suffix == series.suffix) {
            return EntityResolver::kExactVariantConfidence;
        }
        if (mention.suffix.isEmpty() && !series.suffix.isEmpty()) {
            return EntityResolver::kSeriesWeakConfidence;
        }
        // The query names a variant this candidate is not; keep scanning.
    }
    return std::nullopt;
}

std::optional<int> foldConfidence(const QStringList& queryTokens,
                                  const ModelNameRules::FoldName& fold)
{
    const auto mention = ModelNameRules::findFoldMention(queryTokens, fold.series);
    if (!mention || mention->generation != fold.generation) {
        return std::nullopt;
    }
    if (mention->variant == fold.variant) {
        return EntityResolver::kExactVariantConfidence;
    }
    if (mention->variant.isEmpty()) {
        return EntityResolver::kFoldAmbiguousConfidence;
    }
    return std::nullopt;
}

} // namespace

QStringList EntityResolver::queryTokens(const QString& text)
{
    return QueryTokenizer::stripTokens(QueryTokenizer::tokenize(text), brandTokens());
}

std::optional<MatchCandidate> EntityResolver::matchName(const QStringList& queryTokens,
                                                        const QString& modelName)
{
    const QStringList fullTokens =
        QueryTokenizer::stripTokens(QueryTokenizer::tokenize(modelName), brandTokens());
    if (fullTokens.isEmpty()) {
        return std::nullopt;
    }

    MatchCandidate candidate;
    candidate.modelName = modelName;

    if (containsWholeName(queryTokens, fullTokens)) {
        candidate.confidence = kFullNameConfidence;
        candidate.rule = MatchRule::FullName;
        return candidate;
    }

    const QStringList coreTokens = QueryTokenizer::stripTokens(fullTokens, lineTokens());
    if (containsWholeName(queryTokens, coreTokens)) {
        candidate.confidence = kCoreNameConfidence;
        candidate.rule = MatchRule::CoreName;
        return candidate;
    }

    if (const auto series = ModelNameRules::parseSeriesName(coreTokens)) {
        const auto confidence = seriesConfidence(queryTokens, *series);
        if (!confidence) {
            return std::nullopt;
        }
        candidate.confidence = *confidence;
        candidate.rule = MatchRule::Series;
        return candidate;
    }

    if (const auto fold = ModelNameRules::parseFoldName(coreTokens)) {
        const auto confidence = foldConfidence(queryTokens, *fold);
        if (!confidence) {
            return std::nullopt;
        }
        candidate.confidence = *confidence;
        candidate.rule = MatchRule::Foldable;
        return candidate;
    }

    return std::nullopt;
}

std::vector<MatchCandidate> EntityResolver::scoreCandidates(const QString& text,
                                                            const QStringList& knownNames)
{
    const QStringList tokens = queryTokens(text);

    std::vector<MatchCandidate> candidates;
    if (tokens.isEmpty()) {
        return candidates;
    }

    for (const QString& name : knownNames) {
        if (auto candidate = matchName(tokens, name)) {
            candidates.push_back(std::move(*candidate));
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const MatchCandidate& a, const MatchCandidate& b) {
                         return a.confidence > b.confidence;
                     });
    return candidates;
}

QStringList EntityResolver::selectNames(const std::vector<MatchCandidate>& sortedCandidates)
{
    auto collect = [&](int threshold) {
        QStringList names;
        QSet<QString> seen;
        for (const MatchCandidate& candidate : sortedCandidates) {
            if (candidate.confidence >= threshold && !seen.contains(candidate.modelName)) {
                names.append(candidate.modelName);
                seen.insert(candidate.modelName);
            }
        }
        return names;
    };

    QStringList names = collect(kStrongThreshold);
    if (names.isEmpty()) {
        names = collect(kWeakThreshold);
    }
    return names;
}

QStringList EntityResolver::resolveNames(const QString& text, const QStringList& knownNames)
{
    const std::vector<MatchCandidate> candidates = scoreCandidates(text, knownNames);
    const QStringList names = selectNames(candidates);

    LOG_DEBUG(paQuery, "resolveNames: %d candidate(s), %d selected",
              static_cast<int>(candidates.size()), static_cast<int>(names.size()));
    for (const MatchCandidate& candidate : candidates) {
        LOG_DEBUG(paQuery, "  %s confidence=%d rule=%s",
                  qUtf8Printable(candidate.modelName), candidate.confidence,
                  qUtf8Printable(matchRuleToString(candidate.rule)));
    }
    return names;
}

} // namespace pa
