#pragma once

#include "core/answer/generation_strategy.h"
#include "core/answer/generation_types.h"
#include "core/retrieval/retrieval_result.h"

#include <QString>

#include <memory>
#include <vector>

namespace pa {

struct AnswerResult {
    QString text;
    QString producedBy;                        // strategy name, or "template"
    std::vector<GenerationOutcome> failures;   // one per strategy that failed
    bool usedFallback = false;
};

// Ordered list of generation strategies ending in the template renderer.
// answer() never throws and always returns text.
class AnswerChain {
public:
    static constexpr int kDefaultMaxPromptRecords = 5;

    explicit AnswerChain(int maxPromptRecords = kDefaultMaxPromptRecords);
    ~AnswerChain();

    AnswerChain(const AnswerChain&) = delete;
    AnswerChain& operator=(const AnswerChain&) = delete;
    AnswerChain(AnswerChain&&) = default;
    AnswerChain& operator=(AnswerChain&&) = default;

    void addStrategy(std::unique_ptr<GenerationStrategy> strategy);
    size_t strategyCount() const { return m_strategies.size(); }

    AnswerResult answer(const RetrievalResult& retrieval) const;

private:
    std::vector<std::unique_ptr<GenerationStrategy>> m_strategies;
    int m_maxPromptRecords = kDefaultMaxPromptRecords;
};

} // namespace pa
