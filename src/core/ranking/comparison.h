#pragma once

#include "core/shared/phone_record.h"

#include <QString>

#include <vector>

namespace pa {

struct AttributeDifference {
    PhoneAttribute attribute = PhoneAttribute::Display;
    QString valueA;
    QString valueB;
};

struct ComparisonResult {
    PhoneRecord recordA;
    PhoneRecord recordB;
    std::vector<AttributeDifference> differences;  // canonical attribute order
};

class ComparisonDifferencer {
public:
    // Attributes whose text differs exactly, in comparisonAttributeOrder().
    static ComparisonResult diff(const PhoneRecord& recordA, const PhoneRecord& recordB);
};

} // namespace pa
