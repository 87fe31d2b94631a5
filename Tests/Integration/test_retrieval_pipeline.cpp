#include <QtTest/QtTest>
#include "core/answer/answer_chain.h"
#include "core/answer/template_renderer.h"
#include "core/catalog/catalog_importer.h"
#include "core/catalog/sqlite_phone_store.h"
#include "core/ranking/spec_parser.h"
#include "core/retrieval/retrieval_orchestrator.h"

#include <memory>

namespace {

class FailingStrategy : public pa::GenerationStrategy {
public:
    QString name() const override { return QStringLiteral("primary"); }

    pa::GenerationOutcome generate(const pa::PromptContext&) override
    {
        ++calls;
        return pa::GenerationOutcome::failed(name(), pa::GenerationFailure::QuotaExceeded,
                                             QStringLiteral("HTTP 429"));
    }

    int calls = 0;
};

} // namespace

class TestRetrievalPipeline : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testCompareForPhotography();
    void testBatteryRecommendationWithinBudget();
    void testSpecsForSingleModel();
    void testPriceOnlyQuestion();
    void testNoSignalQuestion();
    void testEmptyCatalog();
    void testFailingGeneratorFallsBackToTemplate();

private:
    std::optional<pa::SQLitePhoneStore> m_store;
    pa::AnswerChain m_templateOnly;
};

void TestRetrievalPipeline::initTestCase()
{
    m_store = pa::SQLitePhoneStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    const auto stats = pa::CatalogImporter::importFile(
        QStringLiteral(PA_FIXTURES_DIR "/phones.json"), *m_store);
    QVERIFY(stats.has_value());
    QCOMPARE(m_store->count(), 30);
}

void TestRetrievalPipeline::testCompareForPhotography()
{
    pa::RetrievalOrchestrator orchestrator(*m_store, m_templateOnly);
    const QString question = QStringLiteral("compare Galaxy S23 Ultra and S22 Ultra for photography");

    const pa::RetrievalResult retrieval = orchestrator.retrieve(question);
    QCOMPARE(retrieval.analysis.intent, pa::Intent::Comparison);
    QCOMPARE(retrieval.records.size(), size_t(2));
    QVERIFY(retrieval.comparison.has_value());

    const pa::AnswerResult result = orchestrator.answerWithDetails(question);
    QCOMPARE(result.producedBy, QStringLiteral("template"));
    QVERIFY(result.text.startsWith(
        QStringLiteral("Comparing Samsung Galaxy S23 Ultra vs Samsung Galaxy S22 Ultra:")));
    QVERIFY(result.text.contains(QStringLiteral(
        "Samsung Galaxy S23 Ultra has a better camera (200MP vs 108MP) "
        "and is recommended for photography.")));
}

void TestRetrievalPipeline::testBatteryRecommendationWithinBudget()
{
    pa::RetrievalOrchestrator orchestrator(*m_store, m_templateOnly);
    const QString question = QStringLiteral("Which phone has the best battery under $1000?");

    const pa::RetrievalResult retrieval = orchestrator.retrieve(question);
    QCOMPARE(retrieval.analysis.intent, pa::Intent::Recommendation);
    QCOMPARE(retrieval.analysis.criteria.priceMax.value_or(0.0), 1000.0);
    QVERIFY(retrieval.resolvedNames.isEmpty());
    QCOMPARE(static_cast<int>(retrieval.records.size()),
             pa::RetrievalOrchestrator::kPriceFilterLimit);

    QVERIFY(retrieval.recommendation.has_value());
    QVERIFY(!retrieval.recommendation->empty());
    QVERIFY(static_cast<int>(retrieval.recommendation->size()) <= pa::PhoneScorer::kMaxRecommendations);
    for (const pa::ScoredCandidate& pick : *retrieval.recommendation) {
        const auto price = pa::SpecParser::priceUsd(pick.record.price);
        QVERIFY(price.has_value());
        QVERIFY(*price <= 1000.0);
    }
    // Scores are non-increasing.
    for (size_t i = 1; i < retrieval.recommendation->size(); ++i) {
        QVERIFY((*retrieval.recommendation)[i - 1].score >= (*retrieval.recommendation)[i].score);
    }

    const QString text = orchestrator.answer(question);
    QVERIFY(text.startsWith(QStringLiteral("Best Samsung phones for battery life:")));
    QVERIFY(text.contains(QStringLiteral("1. ") + retrieval.recommendation->front().record.modelName));
    QVERIFY(text.contains(QStringLiteral("Top recommendation: ")
                          + retrieval.recommendation->front().record.modelName));
}

void TestRetrievalPipeline::testSpecsForSingleModel()
{
    pa::RetrievalOrchestrator orchestrator(*m_store, m_templateOnly);
    const QString question = QStringLiteral("Tell me about the Galaxy S24");

    const pa::RetrievalResult retrieval = orchestrator.retrieve(question);
    QCOMPARE(retrieval.analysis.intent, pa::Intent::Specs);
    QCOMPARE(retrieval.resolvedNames, QStringList{QStringLiteral("Samsung Galaxy S24")});

    const QString text = orchestrator.answer(question);
    QVERIFY(text.startsWith(QStringLiteral("Samsung Galaxy S24 specifications:")));
    QVERIFY(text.contains(QStringLiteral("- Price: $799 / €899")));
}

void TestRetrievalPipeline::testPriceOnlyQuestion()
{
    pa::RetrievalOrchestrator orchestrator(*m_store, m_templateOnly);
    const QString question = QStringLiteral("phones below 500");

    const pa::RetrievalResult retrieval = orchestrator.retrieve(question);
    QCOMPARE(retrieval.analysis.intent, pa::Intent::General);
    QCOMPARE(retrieval.records.size(), size_t(6));
    for (const pa::PhoneRecord& record : retrieval.records) {
        QVERIFY(pa::SpecParser::priceUsd(record.price).value_or(1e9) <= 500.0);
    }

    const QString text = orchestrator.answer(question);
    QVERIFY(text.startsWith(QStringLiteral("Best Samsung phones under $500:")));
    QVERIFY(text.contains(QStringLiteral("1. Samsung Galaxy A54 5G")));
}

void TestRetrievalPipeline::testNoSignalQuestion()
{
    pa::RetrievalOrchestrator orchestrator(*m_store, m_templateOnly);
    const pa::AnswerResult result = orchestrator.answerWithDetails(QStringLiteral("hello there"));
    QCOMPARE(result.text, pa::TemplateRenderer::noPhonesFoundMessage());
    QCOMPARE(result.producedBy, QStringLiteral("template"));
}

void TestRetrievalPipeline::testEmptyCatalog()
{
    auto empty = pa::SQLitePhoneStore::open(QStringLiteral(":memory:"));
    QVERIFY(empty.has_value());
    pa::RetrievalOrchestrator orchestrator(*empty, m_templateOnly);

    QCOMPARE(orchestrator.answer(QStringLiteral("What is the best phone under $800?")),
             pa::TemplateRenderer::noPhonesFoundMessage());
    QCOMPARE(orchestrator.answer(QStringLiteral("compare S24 and S23")),
             pa::TemplateRenderer::noPhonesFoundMessage());
}

void TestRetrievalPipeline::testFailingGeneratorFallsBackToTemplate()
{
    auto strategy = std::make_unique<FailingStrategy>();
    FailingStrategy* failing = strategy.get();
    pa::AnswerChain chain;
    chain.addStrategy(std::move(strategy));

    pa::RetrievalOrchestrator orchestrator(*m_store, chain);
    const pa::AnswerResult result =
        orchestrator.answerWithDetails(QStringLiteral("Tell me about the Galaxy S24"));

    QCOMPARE(failing->calls, 1);
    QVERIFY(result.usedFallback);
    QCOMPARE(result.producedBy, QStringLiteral("template"));
    QCOMPARE(result.failures.size(), size_t(1));
    QCOMPARE(result.failures.front().failure, pa::GenerationFailure::QuotaExceeded);
    QVERIFY(result.text.startsWith(QStringLiteral("Samsung Galaxy S24 specifications:")));
}

QTEST_MAIN(TestRetrievalPipeline)
#include "test_retrieval_pipeline.moc"
