#pragma once

#include "core/retrieval/retrieval_result.h"

#include <QString>

namespace pa {

// Deterministic per-intent rendering. Always produces text.
class TemplateRenderer {
public:
    static QString render(const RetrievalResult& retrieval);

    static QString renderSpecs(const PhoneRecord& record);
    static QString renderComparison(const ComparisonResult& comparison,
                                    const CriteriaSet& criteria,
                                    const QString& question);
    static QString renderRecommendation(const std::vector<PhoneRecord>& picks,
                                        const CriteriaSet& criteria);

    static QString noPhonesFoundMessage();
    static QString askAboutModelsMessage();
};

} // namespace pa
