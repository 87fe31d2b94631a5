#pragma once

#include "core/query/structured_query.h"
#include "core/shared/phone_record.h"
#include "core/shared/scoring_types.h"

#include <vector>

namespace pa {

// Additive recommendation scoring. Each signal contributes only when its
// magnitude parses from the record's text; otherwise it adds zero.
class PhoneScorer {
public:
    static constexpr int kMaxRecommendations = 3;

    explicit PhoneScorer(const RecommendationWeights& weights = {});

    ScoreBreakdown computeScore(const PhoneRecord& record,
                                Focus focus,
                                const CriteriaSet& criteria) const;

    double score(const PhoneRecord& record, Focus focus, const CriteriaSet& criteria) const;

    // Scores every record and returns the best kMaxRecommendations,
    // descending. Equal scores keep their input order.
    std::vector<ScoredCandidate> rank(const std::vector<PhoneRecord>& records,
                                      Focus focus,
                                      const CriteriaSet& criteria) const;

    const RecommendationWeights& weights() const { return m_weights; }

private:
    RecommendationWeights m_weights;

    double computeFocusBonus(const PhoneRecord& record, Focus focus) const;
    double computeBudgetAdjustment(const PhoneRecord& record, const CriteriaSet& criteria) const;
};

} // namespace pa
