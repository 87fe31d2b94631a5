#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace pa {

enum class Intent {
    Comparison,
    Recommendation,
    Specs,
    General,
};

enum class Focus {
    Battery,
    Camera,
    Display,
    Overall,
};

// Soft constraints. An unset field means no keyword was recognized.
struct CriteriaSet {
    std::optional<double> priceMax;
    std::optional<Focus> focus;

    Focus effectiveFocus() const { return focus.value_or(Focus::Overall); }
};

struct QueryAnalysis {
    QString originalQuery;
    Intent intent = Intent::General;
    CriteriaSet criteria;
};

// Which resolver rule produced a match.
enum class MatchRule {
    FullName,
    CoreName,
    Series,
    Foldable,
};

struct MatchCandidate {
    QString modelName;
    int confidence = 0;
    MatchRule rule = MatchRule::FullName;
};

QString intentToString(Intent intent);
QString focusToString(Focus focus);
QString matchRuleToString(MatchRule rule);

} // namespace pa
