#pragma once

#include "core/query/structured_query.h"
#include "core/ranking/comparison.h"
#include "core/shared/phone_record.h"
#include "core/shared/scoring_types.h"

#include <QStringList>

#include <optional>
#include <vector>

namespace pa {

// Everything the answer layer needs for one question.
struct RetrievalResult {
    QueryAnalysis analysis;
    QStringList resolvedNames;
    std::vector<PhoneRecord> records;

    // Set for comparison intent with at least two records.
    std::optional<ComparisonResult> comparison;
    // Set for recommendation intent; at most PhoneScorer::kMaxRecommendations.
    std::optional<std::vector<ScoredCandidate>> recommendation;
};

} // namespace pa
