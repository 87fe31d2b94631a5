#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace pa {

// Deterministic pattern rules over token streams produced by QueryTokenizer.
// Each rule is usable on its own; EntityResolver combines them.
class ModelNameRules {
public:
    // "ultra", "plus", "+" or "fe".
    static bool isSuffixToken(const QString& token);

    // "+" and "plus" compare equal.
    static QString canonicalSuffix(const QString& token);

    // Shape <s|a|z|n><digits> optionally followed by one suffix token,
    // e.g. {"s24", "ultra"} or {"a54"}.
    struct SeriesName {
        QString modelToken;
        QString suffix;  // canonical, empty when absent
    };
    static std::optional<SeriesName> parseSeriesName(const QStringList& coreTokens);

    // Every occurrence of modelToken in the query together with the suffix
    // token that directly follows it (if any).
    struct SeriesMention {
        int tokenIndex = -1;
        QString suffix;  // canonical, empty when absent
    };
    static std::vector<SeriesMention> findSeriesMentions(const QStringList& queryTokens,
                                                         const QString& modelToken);

    // "z fold 5", "z flip 6 fe", "zfold5", ...
    struct FoldName {
        QString series;      // "fold" or "flip"
        QString generation;  // digits, may be empty
        QString variant;     // "fe", "special" or empty
    };
    static std::optional<FoldName> parseFoldName(const QStringList& coreTokens);

    // First fold/flip mention of the given series in the query.
    static std::optional<FoldName> findFoldMention(const QStringList& queryTokens,
                                                   const QString& series);
};

} // namespace pa
