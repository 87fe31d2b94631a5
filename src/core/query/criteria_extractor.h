#pragma once

#include "core/query/structured_query.h"

#include <QString>

#include <optional>

namespace pa {

class CriteriaExtractor {
public:
    // Intent plus soft constraints. Pure; never fails.
    static QueryAnalysis classify(const QString& text);

    static Intent detectIntent(const QString& lowerText);
    static std::optional<double> extractPriceMax(const QString& lowerText);

    // Groups are checked battery, camera, display; the last group that
    // matches wins.
    static std::optional<Focus> detectFocus(const QString& lowerText);
};

} // namespace pa
