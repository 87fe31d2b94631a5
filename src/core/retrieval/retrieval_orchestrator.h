#pragma once

#include "core/answer/answer_chain.h"
#include "core/catalog/phone_catalog.h"
#include "core/ranking/phone_scorer.h"
#include "core/retrieval/retrieval_result.h"

#include <QString>

namespace pa {

// classify -> resolve -> fetch -> compare/rank -> answer.
// Holds references only; both collaborators must outlive the orchestrator.
class RetrievalOrchestrator {
public:
    static constexpr int kPriceFilterLimit = 10;

    RetrievalOrchestrator(const PhoneCatalog& catalog,
                          const AnswerChain& answerChain,
                          PhoneScorer scorer = PhoneScorer());

    RetrievalResult retrieve(const QString& question) const;

    AnswerResult answerWithDetails(const QString& question) const;
    QString answer(const QString& question) const;

private:
    std::vector<PhoneRecord> fetchRecords(const QueryAnalysis& analysis,
                                          const QStringList& resolvedNames) const;

    const PhoneCatalog& m_catalog;
    const AnswerChain& m_answerChain;
    PhoneScorer m_scorer;
};

} // namespace pa
