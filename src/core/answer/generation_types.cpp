#include "core/answer/generation_types.h"

namespace pa {

QString generationFailureToString(GenerationFailure failure)
{
    switch (failure) {
    case GenerationFailure::None:              return QStringLiteral("none");
    case GenerationFailure::Unavailable:       return QStringLiteral("unavailable");
    case GenerationFailure::CircuitOpen:       return QStringLiteral("circuit_open");
    case GenerationFailure::Timeout:           return QStringLiteral("timeout");
    case GenerationFailure::QuotaExceeded:     return QStringLiteral("quota_exceeded");
    case GenerationFailure::TransportError:    return QStringLiteral("transport_error");
    case GenerationFailure::HttpError:         return QStringLiteral("http_error");
    case GenerationFailure::MalformedResponse: return QStringLiteral("malformed_response");
    case GenerationFailure::EmptyResponse:     return QStringLiteral("empty_response");
    }
    return QStringLiteral("unknown");
}

GenerationOutcome GenerationOutcome::success(const QString& backend, const QString& text)
{
    GenerationOutcome outcome;
    outcome.backend = backend;
    outcome.text = text;
    return outcome;
}

GenerationOutcome GenerationOutcome::failed(const QString& backend,
                                            GenerationFailure failure,
                                            const QString& detail)
{
    GenerationOutcome outcome;
    outcome.backend = backend;
    outcome.failure = failure;
    outcome.detail = detail;
    return outcome;
}

} // namespace pa
