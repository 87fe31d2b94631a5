#pragma once

#include "core/answer/generation_strategy.h"
#include "core/answer/generator_circuit_breaker.h"
#include "core/shared/settings.h"

#include <QString>

#include <cstdint>

namespace pa {

// Generative backend speaking the Ollama-style /api/generate protocol:
//   POST {"model": ..., "prompt": ..., "stream": false}
//   200  {"response": "..."}
// Each call blocks on a local event loop for at most timeoutMs.
class HttpGenerator : public GenerationStrategy {
public:
    HttpGenerator(const QString& name, const GeneratorEndpoint& endpoint, uint32_t timeoutMs,
                  GeneratorCircuitBreaker::Clock clock = &GeneratorCircuitBreaker::steadyNowMs);

    QString name() const override { return m_name; }
    GenerationOutcome generate(const PromptContext& context) override;

    const GeneratorCircuitBreaker& circuitBreaker() const { return m_circuitBreaker; }

private:
    GenerationOutcome post(const QString& prompt);

    QString m_name;
    GeneratorEndpoint m_endpoint;
    uint32_t m_timeoutMs = 0;
    GeneratorCircuitBreaker m_circuitBreaker;
};

} // namespace pa
