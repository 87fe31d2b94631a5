#include "core/answer/generator_circuit_breaker.h"
#include "core/shared/logging.h"

#include <chrono>
#include <utility>

namespace pa {

namespace {

bool countsAgainstBackend(GenerationFailure failure)
{
    switch (failure) {
    case GenerationFailure::None:
    case GenerationFailure::Unavailable:
    case GenerationFailure::CircuitOpen:
        return false;
    case GenerationFailure::Timeout:
    case GenerationFailure::QuotaExceeded:
    case GenerationFailure::TransportError:
    case GenerationFailure::HttpError:
    case GenerationFailure::MalformedResponse:
    case GenerationFailure::EmptyResponse:
        return true;
    }
    return false;
}

} // namespace

QString circuitStateToString(GeneratorCircuitBreaker::State state)
{
    switch (state) {
    case GeneratorCircuitBreaker::State::Closed:   return QStringLiteral("closed");
    case GeneratorCircuitBreaker::State::Open:     return QStringLiteral("open");
    case GeneratorCircuitBreaker::State::HalfOpen: return QStringLiteral("half_open");
    }
    return QStringLiteral("unknown");
}

GeneratorCircuitBreaker::GeneratorCircuitBreaker(const QString& backend, Clock clock)
    : m_backend(backend)
    , m_clock(std::move(clock))
{
}

int64_t GeneratorCircuitBreaker::steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

bool GeneratorCircuitBreaker::allowRequest()
{
    switch (m_state) {
    case State::Closed:
        return true;
    case State::HalfOpen:
        // The trial call has not reported back yet.
        return false;
    case State::Open:
        if (m_clock() - m_openedAtMs < kCooldownMs) {
            return false;
        }
        m_state = State::HalfOpen;
        LOG_INFO(paAnswer, "%s: cooldown over, sending a trial request", qUtf8Printable(m_backend));
        return true;
    }
    return false;
}

void GeneratorCircuitBreaker::record(GenerationFailure failure)
{
    if (failure == GenerationFailure::None) {
        if (m_state != State::Closed) {
            LOG_INFO(paAnswer, "%s: circuit closed", qUtf8Printable(m_backend));
        }
        m_state = State::Closed;
        m_consecutiveFailures = 0;
        return;
    }
    if (!countsAgainstBackend(failure)) {
        return;
    }

    ++m_consecutiveFailures;
    if (m_state == State::HalfOpen
        || failure == GenerationFailure::QuotaExceeded
        || m_consecutiveFailures >= kOpenThreshold) {
        open(failure);
    }
}

void GeneratorCircuitBreaker::open(GenerationFailure cause)
{
    m_state = State::Open;
    m_openedAtMs = m_clock();
    LOG_WARN(paAnswer, "%s: circuit open for %lld ms after %s (%d consecutive)",
             qUtf8Printable(m_backend), static_cast<long long>(kCooldownMs),
             qUtf8Printable(generationFailureToString(cause)), m_consecutiveFailures);
}

} // namespace pa
