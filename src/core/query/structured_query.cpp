#include "core/query/structured_query.h"

namespace pa {

QString intentToString(Intent intent)
{
    switch (intent) {
    case Intent::Comparison:     return QStringLiteral("comparison");
    case Intent::Recommendation: return QStringLiteral("recommendation");
    case Intent::Specs:          return QStringLiteral("specs");
    case Intent::General:        return QStringLiteral("general");
    }
    return QStringLiteral("general");
}

QString focusToString(Focus focus)
{
    switch (focus) {
    case Focus::Battery: return QStringLiteral("battery");
    case Focus::Camera:  return QStringLiteral("camera");
    case Focus::Display: return QStringLiteral("display");
    case Focus::Overall: return QStringLiteral("overall");
    }
    return QStringLiteral("overall");
}

QString matchRuleToString(MatchRule rule)
{
    switch (rule) {
    case MatchRule::FullName: return QStringLiteral("full_name");
    case MatchRule::CoreName: return QStringLiteral("core_name");
    case MatchRule::Series:   return QStringLiteral("series");
    case MatchRule::Foldable: return QStringLiteral("foldable");
    }
    return QStringLiteral("unknown");
}

} // namespace pa
