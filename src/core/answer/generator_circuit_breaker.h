#pragma once

#include "core/answer/generation_types.h"

#include <QString>

#include <cstdint>
#include <functional>

namespace pa {

// Per-backend breaker fed with generation outcomes.
//
// Closed: calls go through; kOpenThreshold consecutive backend faults open it.
// Open: calls are refused until kCooldownMs has passed since it opened.
// HalfOpen: a single trial call is let through; success closes the circuit,
// any fault re-opens it for another cooldown.
//
// A quota refusal (HTTP 429) opens the circuit at once. Unavailable and
// CircuitOpen are decided locally and never count against the backend.
// Not thread-safe; each HttpGenerator owns one.
class GeneratorCircuitBreaker {
public:
    using Clock = std::function<int64_t()>;

    enum class State { Closed, Open, HalfOpen };

    static constexpr int kOpenThreshold = 5;
    static constexpr int64_t kCooldownMs = 30000;

    explicit GeneratorCircuitBreaker(const QString& backend, Clock clock = &steadyNowMs);

    // False while open. Moves Open -> HalfOpen once the cooldown is over.
    bool allowRequest();
    void record(GenerationFailure failure);

    State state() const { return m_state; }
    int consecutiveFailures() const { return m_consecutiveFailures; }

    static int64_t steadyNowMs();

private:
    void open(GenerationFailure cause);

    QString m_backend;
    Clock m_clock;
    State m_state = State::Closed;
    int m_consecutiveFailures = 0;
    int64_t m_openedAtMs = 0;
};

QString circuitStateToString(GeneratorCircuitBreaker::State state);

} // namespace pa
