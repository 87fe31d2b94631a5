#include "core/retrieval/retrieval_orchestrator.h"
#include "core/query/criteria_extractor.h"
#include "core/query/entity_resolver.h"
#include "core/ranking/comparison.h"
#include "core/shared/logging.h"

#include <QSet>

#include <utility>

namespace pa {

RetrievalOrchestrator::RetrievalOrchestrator(const PhoneCatalog& catalog,
                                             const AnswerChain& answerChain,
                                             PhoneScorer scorer)
    : m_catalog(catalog)
    , m_answerChain(answerChain)
    , m_scorer(std::move(scorer))
{
}

std::vector<PhoneRecord> RetrievalOrchestrator::fetchRecords(const QueryAnalysis& analysis,
                                                             const QStringList& resolvedNames) const
{
    if (!resolvedNames.isEmpty()) {
        std::vector<PhoneRecord> records;
        QSet<QString> seen;
        for (const QString& name : resolvedNames) {
            std::optional<PhoneRecord> record = m_catalog.findByName(name);
            if (!record) {
                LOG_DEBUG(paCore, "Resolved name not in catalog: %s", qUtf8Printable(name));
                continue;
            }
            if (seen.contains(record->modelName)) {
                continue;
            }
            seen.insert(record->modelName);
            records.push_back(std::move(*record));
        }
        return records;
    }

    if (analysis.criteria.priceMax.has_value()) {
        return m_catalog.filterByMaxPrice(*analysis.criteria.priceMax, kPriceFilterLimit);
    }

    if (analysis.intent == Intent::Recommendation) {
        return m_catalog.listAll();
    }

    return {};
}

RetrievalResult RetrievalOrchestrator::retrieve(const QString& question) const
{
    RetrievalResult result;
    result.analysis = CriteriaExtractor::classify(question);
    result.resolvedNames = EntityResolver::resolveNames(question, m_catalog.listAllNames());
    result.records = fetchRecords(result.analysis, result.resolvedNames);

    const QueryAnalysis& analysis = result.analysis;
    if (analysis.intent == Intent::Comparison && result.records.size() >= 2) {
        result.comparison = ComparisonDifferencer::diff(result.records[0], result.records[1]);
    } else if (analysis.intent == Intent::Recommendation) {
        result.recommendation = m_scorer.rank(result.records,
                                              analysis.criteria.effectiveFocus(),
                                              analysis.criteria);
    }

    LOG_INFO(paCore, "Query intent=%s resolved=%d records=%d",
             qUtf8Printable(intentToString(analysis.intent)),
             static_cast<int>(result.resolvedNames.size()),
             static_cast<int>(result.records.size()));
    return result;
}

AnswerResult RetrievalOrchestrator::answerWithDetails(const QString& question) const
{
    return m_answerChain.answer(retrieve(question));
}

QString RetrievalOrchestrator::answer(const QString& question) const
{
    return answerWithDetails(question).text;
}

} // namespace pa
