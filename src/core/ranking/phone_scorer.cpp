#include "core/ranking/phone_scorer.h"
#include "core/ranking/spec_parser.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace pa {

PhoneScorer::PhoneScorer(const RecommendationWeights& weights)
    : m_weights(weights)
{
}

double PhoneScorer::computeFocusBonus(const PhoneRecord& record, Focus focus) const
{
    switch (focus) {
    case Focus::Battery:
        if (const auto mah = SpecParser::batteryMah(record.battery)) {
            return static_cast<double>(*mah) / m_weights.focusBatteryMahDivisor;
        }
        return 0.0;
    case Focus::Camera:
        if (const auto mp = SpecParser::cameraMegapixels(record.camera)) {
            return static_cast<double>(*mp) / m_weights.focusCameraMpDivisor;
        }
        return 0.0;
    case Focus::Display: {
        double bonus = 0.0;
        if (SpecParser::mentionsHighRefresh(record.display)) {
            bonus += m_weights.highRefreshBonus;
        }
        if (SpecParser::mentionsAmoled(record.display)) {
            bonus += m_weights.amoledBonus;
        }
        return bonus;
    }
    case Focus::Overall:
        return 0.0;
    }
    return 0.0;
}

double PhoneScorer::computeBudgetAdjustment(const PhoneRecord& record,
                                            const CriteriaSet& criteria) const
{
    if (!criteria.priceMax.has_value()) {
        return 0.0;
    }
    const auto price = SpecParser::priceUsd(record.price);
    if (!price.has_value()) {
        return 0.0;
    }
    return *price <= *criteria.priceMax ? m_weights.withinBudgetBonus
                                        : -m_weights.overBudgetPenalty;
}

ScoreBreakdown PhoneScorer::computeScore(const PhoneRecord& record,
                                         Focus focus,
                                         const CriteriaSet& criteria) const
{
    ScoreBreakdown breakdown;

    if (const auto mah = SpecParser::batteryMah(record.battery)) {
        breakdown.batteryScore = static_cast<double>(*mah) / m_weights.batteryMahDivisor;
    }
    if (const auto mp = SpecParser::cameraMegapixels(record.camera)) {
        breakdown.cameraScore = static_cast<double>(*mp) / m_weights.cameraMpDivisor;
    }
    if (const auto gb = SpecParser::ramGigabytes(record.ram)) {
        breakdown.ramScore = static_cast<double>(*gb) / m_weights.ramGbDivisor;
    }

    breakdown.focusBonus = computeFocusBonus(record, focus);
    breakdown.budgetAdjustment = computeBudgetAdjustment(record, criteria);

    LOG_DEBUG(paRanking,
              "computeScore: model='%s' battery=%.2f camera=%.2f ram=%.2f "
              "focus=%.2f budget=%.2f",
              qUtf8Printable(record.modelName), breakdown.batteryScore,
              breakdown.cameraScore, breakdown.ramScore, breakdown.focusBonus,
              breakdown.budgetAdjustment);

    return breakdown;
}

double PhoneScorer::score(const PhoneRecord& record, Focus focus, const CriteriaSet& criteria) const
{
    return computeScore(record, focus, criteria).total();
}

std::vector<ScoredCandidate> PhoneScorer::rank(const std::vector<PhoneRecord>& records,
                                               Focus focus,
                                               const CriteriaSet& criteria) const
{
    std::vector<ScoredCandidate> scored;
    scored.reserve(records.size());
    for (const PhoneRecord& record : records) {
        ScoredCandidate candidate;
        candidate.record = record;
        candidate.breakdown = computeScore(record, focus, criteria);
        candidate.score = candidate.breakdown.total();
        scored.push_back(std::move(candidate));
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         return a.score > b.score;
                     });

    if (scored.size() > static_cast<size_t>(kMaxRecommendations)) {
        scored.resize(kMaxRecommendations);
    }

    LOG_INFO(paRanking, "rank: %zu candidate(s), kept %zu", records.size(), scored.size());
    return scored;
}

} // namespace pa
