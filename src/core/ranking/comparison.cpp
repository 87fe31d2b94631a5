#include "core/ranking/comparison.h"

namespace pa {

ComparisonResult ComparisonDifferencer::diff(const PhoneRecord& recordA, const PhoneRecord& recordB)
{
    ComparisonResult result;
    result.recordA = recordA;
    result.recordB = recordB;

    for (PhoneAttribute attribute : comparisonAttributeOrder()) {
        const QString& a = recordA.value(attribute);
        const QString& b = recordB.value(attribute);
        if (a != b) {
            result.differences.push_back({attribute, a, b});
        }
    }
    return result;
}

} // namespace pa
