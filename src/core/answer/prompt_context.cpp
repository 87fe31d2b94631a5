#include "core/answer/prompt_context.h"
#include "core/retrieval/retrieval_result.h"

#include <QStringList>

#include <algorithm>

namespace pa {

namespace {

QString criteriaText(const CriteriaSet& criteria)
{
    QStringList parts;
    parts.append(QStringLiteral("focus=%1").arg(focusToString(criteria.effectiveFocus())));
    if (criteria.priceMax.has_value()) {
        parts.append(QStringLiteral("price_max=%1").arg(*criteria.priceMax, 0, 'f', 0));
    }
    return parts.join(QStringLiteral(", "));
}

} // namespace

PromptContext PromptContext::fromRetrieval(const RetrievalResult& retrieval, int maxRecords)
{
    PromptContext context;
    context.question = retrieval.analysis.originalQuery;
    context.intent = retrieval.analysis.intent;
    context.criteria = retrieval.analysis.criteria;

    // Ranked picks go first so the backend sees the same order as the template.
    std::vector<PhoneRecord> ordered;
    if (retrieval.recommendation.has_value()) {
        for (const ScoredCandidate& candidate : *retrieval.recommendation) {
            ordered.push_back(candidate.record);
        }
    }
    for (const PhoneRecord& record : retrieval.records) {
        const bool alreadyListed = std::any_of(ordered.begin(), ordered.end(),
            [&](const PhoneRecord& listed) { return listed.modelName == record.modelName; });
        if (!alreadyListed) {
            ordered.push_back(record);
        }
    }

    const size_t cap = static_cast<size_t>(std::max(0, maxRecords));
    if (ordered.size() > cap) {
        ordered.resize(cap);
    }
    context.records = std::move(ordered);
    return context;
}

QString PromptContext::render() const
{
    static const std::vector<PhoneAttribute> kPromptAttributes = {
        PhoneAttribute::ReleaseDate, PhoneAttribute::Display, PhoneAttribute::Battery,
        PhoneAttribute::Camera,      PhoneAttribute::Ram,     PhoneAttribute::Storage,
        PhoneAttribute::Chipset,     PhoneAttribute::Price,
    };

    QString phones;
    for (const PhoneRecord& record : records) {
        phones += QStringLiteral("\nPhone: %1\n").arg(record.modelName);
        for (PhoneAttribute attribute : kPromptAttributes) {
            phones += QStringLiteral("- %1: %2\n")
                          .arg(phoneAttributeLabel(attribute), displayValue(record.value(attribute)));
        }
    }

    return QStringLiteral(
               "You are a Samsung phone expert assistant. Based on the following phone data, "
               "answer the user's question.\n\n"
               "User Question: %1\n"
               "Query Type: %2\n"
               "Criteria: %3\n\n"
               "Available Phone Data:\n%4\n"
               "Provide a helpful, concise response that:\n"
               "1. Directly answers the user's question\n"
               "2. Includes relevant specifications\n"
               "3. Gives clear recommendations if asked\n"
               "4. Highlights key differences in comparisons\n"
               "Keep the response under 200 words and focus on the most relevant information.")
        .arg(question, intentToString(intent), criteriaText(criteria), phones);
}

} // namespace pa
