#pragma once

#include "core/shared/phone_record.h"

namespace pa {

// Normalization divisors and bonuses for recommendation scoring.
struct RecommendationWeights {
    // Base signals
    double batteryMahDivisor = 1000.0;
    double cameraMpDivisor = 50.0;
    double ramGbDivisor = 4.0;

    // Focus bonuses
    double focusBatteryMahDivisor = 500.0;
    double focusCameraMpDivisor = 25.0;
    double highRefreshBonus = 2.0;
    double amoledBonus = 1.0;

    // Budget adjustment
    double withinBudgetBonus = 3.0;
    double overBudgetPenalty = 5.0;
};

struct ScoreBreakdown {
    double batteryScore = 0.0;
    double cameraScore = 0.0;
    double ramScore = 0.0;
    double focusBonus = 0.0;
    double budgetAdjustment = 0.0;  // may be negative

    double total() const
    {
        return batteryScore + cameraScore + ramScore + focusBonus + budgetAdjustment;
    }
};

struct ScoredCandidate {
    PhoneRecord record;
    double score = 0.0;
    ScoreBreakdown breakdown;
};

} // namespace pa
