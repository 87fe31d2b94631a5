#include "core/answer/answer_chain.h"
#include "core/answer/prompt_context.h"
#include "core/answer/template_renderer.h"
#include "core/shared/logging.h"

namespace pa {

AnswerChain::AnswerChain(int maxPromptRecords)
    : m_maxPromptRecords(maxPromptRecords)
{
}

AnswerChain::~AnswerChain() = default;

void AnswerChain::addStrategy(std::unique_ptr<GenerationStrategy> strategy)
{
    if (strategy) {
        m_strategies.push_back(std::move(strategy));
    }
}

AnswerResult AnswerChain::answer(const RetrievalResult& retrieval) const
{
    AnswerResult result;

    // Nothing to ground a generated answer on; the fixed message is the answer.
    if (!retrieval.records.empty()) {
        const PromptContext context = PromptContext::fromRetrieval(retrieval, m_maxPromptRecords);
        for (const auto& strategy : m_strategies) {
            GenerationOutcome outcome = strategy->generate(context);
            if (outcome.succeeded()) {
                result.text = *outcome.text;
                result.producedBy = strategy->name();
                return result;
            }
            LOG_WARN(paAnswer, "%s failed (%s): %s",
                     qUtf8Printable(strategy->name()),
                     qUtf8Printable(generationFailureToString(outcome.failure)),
                     qUtf8Printable(outcome.detail));
            result.failures.push_back(std::move(outcome));
        }
    }

    result.text = TemplateRenderer::render(retrieval);
    result.producedBy = QStringLiteral("template");
    result.usedFallback = true;
    LOG_DEBUG(paAnswer, "Rendered template answer (%d strategies failed)",
              static_cast<int>(result.failures.size()));
    return result;
}

} // namespace pa
