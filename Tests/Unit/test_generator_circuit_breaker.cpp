#include <QtTest/QtTest>
#include "core/answer/generator_circuit_breaker.h"

using pa::GenerationFailure;
using pa::GeneratorCircuitBreaker;
using State = pa::GeneratorCircuitBreaker::State;

Q_DECLARE_METATYPE(pa::GenerationFailure)

namespace {

// Manually advanced clock shared with the breaker under test.
struct FakeClock {
    int64_t nowMs = 1000000;

    GeneratorCircuitBreaker::Clock fn()
    {
        return [this]() { return nowMs; };
    }
};

void failTimes(GeneratorCircuitBreaker& breaker, int times,
               GenerationFailure failure = GenerationFailure::Timeout)
{
    for (int i = 0; i < times; ++i) {
        QVERIFY(breaker.allowRequest());
        breaker.record(failure);
    }
}

} // namespace

class TestGeneratorCircuitBreaker : public QObject {
    Q_OBJECT

private slots:
    void testBackendFaultsOpenTheCircuit_data();
    void testBackendFaultsOpenTheCircuit();
    void testLocalOutcomesNeverCount_data();
    void testLocalOutcomesNeverCount();
    void testSuccessResetsTheStreak();
    void testQuotaRefusalOpensImmediately();
    void testCooldownAllowsOneTrial();
    void testFailedTrialReopensForAnotherCooldown();
    void testSuccessfulTrialCloses();
    void testStateNames();
};

void TestGeneratorCircuitBreaker::testBackendFaultsOpenTheCircuit_data()
{
    QTest::addColumn<GenerationFailure>("failure");
    QTest::newRow("timeout") << GenerationFailure::Timeout;
    QTest::newRow("transport") << GenerationFailure::TransportError;
    QTest::newRow("http") << GenerationFailure::HttpError;
    QTest::newRow("malformed") << GenerationFailure::MalformedResponse;
    QTest::newRow("empty") << GenerationFailure::EmptyResponse;
}

void TestGeneratorCircuitBreaker::testBackendFaultsOpenTheCircuit()
{
    QFETCH(GenerationFailure, failure);
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());

    failTimes(breaker, GeneratorCircuitBreaker::kOpenThreshold - 1, failure);
    QCOMPARE(breaker.state(), State::Closed);
    QCOMPARE(breaker.consecutiveFailures(), GeneratorCircuitBreaker::kOpenThreshold - 1);

    failTimes(breaker, 1, failure);
    QCOMPARE(breaker.state(), State::Open);
    QVERIFY(!breaker.allowRequest());
}

void TestGeneratorCircuitBreaker::testLocalOutcomesNeverCount_data()
{
    QTest::addColumn<GenerationFailure>("failure");
    QTest::newRow("unavailable") << GenerationFailure::Unavailable;
    QTest::newRow("circuit-open") << GenerationFailure::CircuitOpen;
}

void TestGeneratorCircuitBreaker::testLocalOutcomesNeverCount()
{
    QFETCH(GenerationFailure, failure);
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());

    failTimes(breaker, GeneratorCircuitBreaker::kOpenThreshold * 2, failure);
    QCOMPARE(breaker.state(), State::Closed);
    QCOMPARE(breaker.consecutiveFailures(), 0);
}

void TestGeneratorCircuitBreaker::testSuccessResetsTheStreak()
{
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());

    failTimes(breaker, GeneratorCircuitBreaker::kOpenThreshold - 1);
    breaker.record(GenerationFailure::None);
    QCOMPARE(breaker.consecutiveFailures(), 0);

    // The streak starts over, so one more fault does not open it.
    failTimes(breaker, 1);
    QCOMPARE(breaker.state(), State::Closed);
}

void TestGeneratorCircuitBreaker::testQuotaRefusalOpensImmediately()
{
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());

    failTimes(breaker, 1, GenerationFailure::QuotaExceeded);
    QCOMPARE(breaker.state(), State::Open);
    QCOMPARE(breaker.consecutiveFailures(), 1);
    QVERIFY(!breaker.allowRequest());
}

void TestGeneratorCircuitBreaker::testCooldownAllowsOneTrial()
{
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());
    failTimes(breaker, GeneratorCircuitBreaker::kOpenThreshold);

    clock.nowMs += GeneratorCircuitBreaker::kCooldownMs - 1;
    QVERIFY(!breaker.allowRequest());

    clock.nowMs += 1;
    QVERIFY(breaker.allowRequest());
    QCOMPARE(breaker.state(), State::HalfOpen);

    // Only one trial until it reports back.
    QVERIFY(!breaker.allowRequest());
}

void TestGeneratorCircuitBreaker::testFailedTrialReopensForAnotherCooldown()
{
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());
    failTimes(breaker, GeneratorCircuitBreaker::kOpenThreshold);

    clock.nowMs += GeneratorCircuitBreaker::kCooldownMs;
    QVERIFY(breaker.allowRequest());
    breaker.record(GenerationFailure::EmptyResponse);
    QCOMPARE(breaker.state(), State::Open);

    // The new cooldown runs from the failed trial, not the first opening.
    clock.nowMs += GeneratorCircuitBreaker::kCooldownMs / 2;
    QVERIFY(!breaker.allowRequest());
    clock.nowMs += GeneratorCircuitBreaker::kCooldownMs / 2;
    QVERIFY(breaker.allowRequest());
}

void TestGeneratorCircuitBreaker::testSuccessfulTrialCloses()
{
    FakeClock clock;
    GeneratorCircuitBreaker breaker(QStringLiteral("primary"), clock.fn());
    failTimes(breaker, 1, GenerationFailure::QuotaExceeded);

    clock.nowMs += GeneratorCircuitBreaker::kCooldownMs;
    QVERIFY(breaker.allowRequest());
    breaker.record(GenerationFailure::None);

    QCOMPARE(breaker.state(), State::Closed);
    QCOMPARE(breaker.consecutiveFailures(), 0);
    QVERIFY(breaker.allowRequest());
}

void TestGeneratorCircuitBreaker::testStateNames()
{
    QCOMPARE(pa::circuitStateToString(State::Closed), QStringLiteral("closed"));
    QCOMPARE(pa::circuitStateToString(State::Open), QStringLiteral("open"));
    QCOMPARE(pa::circuitStateToString(State::HalfOpen), QStringLiteral("half_open"));
}

QTEST_MAIN(TestGeneratorCircuitBreaker)
#include "test_generator_circuit_breaker.moc"
