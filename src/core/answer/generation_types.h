#pragma once

#include <QString>

#include <optional>

namespace pa {

enum class GenerationFailure {
    None,
    Unavailable,        // backend not configured
    CircuitOpen,        // skipped after repeated failures
    Timeout,
    QuotaExceeded,      // HTTP 429
    TransportError,     // connection refused, DNS, TLS, ...
    HttpError,          // any other non-200 status
    MalformedResponse,  // body is not the expected JSON
    EmptyResponse,
};

QString generationFailureToString(GenerationFailure failure);

struct GenerationOutcome {
    QString backend;
    std::optional<QString> text;
    GenerationFailure failure = GenerationFailure::None;
    QString detail;

    bool succeeded() const { return text.has_value(); }

    static GenerationOutcome success(const QString& backend, const QString& text);
    static GenerationOutcome failed(const QString& backend,
                                    GenerationFailure failure,
                                    const QString& detail = {});
};

} // namespace pa
