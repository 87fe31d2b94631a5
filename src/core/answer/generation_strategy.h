#pragma once

#include "core/answer/generation_types.h"
#include "core/answer/prompt_context.h"

#include <QString>

namespace pa {

// One way of turning a prompt into prose. Implementations report failure
// through GenerationOutcome and must not throw.
class GenerationStrategy {
public:
    virtual ~GenerationStrategy() = default;

    virtual QString name() const = 0;
    virtual GenerationOutcome generate(const PromptContext& context) = 0;
};

} // namespace pa
