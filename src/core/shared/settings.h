#pragma once

#include <QString>
#include <cstdint>

namespace pa {

// One generative backend. An empty endpoint disables the backend.
struct GeneratorEndpoint {
    QString endpoint;   // e.g. http://127.0.0.1:11434/api/generate
    QString model;
};

inline constexpr uint32_t kMaxGeneratorTimeoutMs = 10 * 60 * 1000;

struct Settings {
    // Catalog
    QString dbPath;
    QString seedCatalogPath;

    // Generation
    GeneratorEndpoint primaryGenerator;
    GeneratorEndpoint secondaryGenerator;
    uint32_t generatorTimeoutMs = 20000;    // loaded values are clamped to [1, kMaxGeneratorTimeoutMs]
    int maxPromptRecords = 5;

    // Request validation
    int minQuestionLength = 3;
};

} // namespace pa
