#pragma once

#include "core/query/structured_query.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace pa {

// Resolves free text to catalog model names.
//
// Both the query and each candidate name are tokenized with "samsung"
// dropped; the core name additionally drops "galaxy". Rules are tried in
// order and the first one that fires sets the candidate's confidence:
//   full name 100, core name 95, series+suffix 90/30, fold/flip 90/40.
class EntityResolver {
public:
    static constexpr int kFullNameConfidence = 100;
    static constexpr int kCoreNameConfidence = 95;
    static constexpr int kExactVariantConfidence = 90;
    static constexpr int kFoldAmbiguousConfidence = 40;
    static constexpr int kSeriesWeakConfidence = 30;

    static constexpr int kStrongThreshold = 80;
    static constexpr int kWeakThreshold = 30;

    // Names ordered by confidence (stable for ties), deduplicated. Strong
    // matches only; weak ones when nothing strong exists. Empty means no
    // entity was recognized.
    static QStringList resolveNames(const QString& text, const QStringList& knownNames);

    // Every (name, confidence) pair, sorted by confidence descending.
    static std::vector<MatchCandidate> scoreCandidates(const QString& text,
                                                       const QStringList& knownNames);

    // Selection policy applied by resolveNames().
    static QStringList selectNames(const std::vector<MatchCandidate>& sortedCandidates);

    static std::optional<MatchCandidate> matchName(const QStringList& queryTokens,
                                                   const QString& modelName);

    static QStringList queryTokens(const QString& text);
};

} // namespace pa
