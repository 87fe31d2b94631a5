#include "advisor_service.h"
#include "core/answer/http_generator.h"
#include "core/catalog/catalog_importer.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

namespace pa {

AdvisorService::AdvisorService(const Settings& settings, QObject* parent)
    : ServiceBase(QStringLiteral("advisor"), parent)
    , m_settings(settings)
    , m_answerChain(buildAnswerChain(settings))
{
    LOG_INFO(paCore, "AdvisorService created (%d generator(s))",
             static_cast<int>(m_answerChain.strategyCount()));
}

AdvisorService::~AdvisorService() = default;

AnswerChain AdvisorService::buildAnswerChain(const Settings& settings)
{
    AnswerChain chain(settings.maxPromptRecords);
    if (!settings.primaryGenerator.endpoint.isEmpty()) {
        chain.addStrategy(std::make_unique<HttpGenerator>(
            QStringLiteral("primary"), settings.primaryGenerator, settings.generatorTimeoutMs));
    }
    if (!settings.secondaryGenerator.endpoint.isEmpty()) {
        chain.addStrategy(std::make_unique<HttpGenerator>(
            QStringLiteral("secondary"), settings.secondaryGenerator, settings.generatorTimeoutMs));
    }
    return chain;
}

QJsonObject AdvisorService::handleRequest(const QJsonObject& request)
{
    const QString name = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = IpcMessage::params(request);

    if (name == QLatin1String(method::kAsk))        return handleAsk(id, params);
    if (name == QLatin1String(method::kListPhones)) return handleListPhones(id);
    if (name == QLatin1String(method::kGetPhone))   return handleGetPhone(id, params);
    if (name == QLatin1String(method::kGetHealth))  return handleGetHealth(id);

    return ServiceBase::handleRequest(request);
}

bool AdvisorService::ensureStoreOpen()
{
    if (m_store.has_value()) {
        return true;
    }

    const QString dbPath = m_settings.dbPath;
    if (dbPath != QLatin1String(":memory:")) {
        const QString dir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(dir)) {
            LOG_WARN(paCatalog, "Cannot create catalog directory %s", qPrintable(dir));
        }
    }

    auto store = SQLitePhoneStore::open(dbPath);
    if (!store.has_value()) {
        LOG_ERROR(paCatalog, "Failed to open catalog at %s", qPrintable(dbPath));
        return false;
    }
    m_store.emplace(std::move(store.value()));
    LOG_INFO(paCatalog, "Catalog opened at %s", qPrintable(dbPath));

    seedIfEmpty();
    m_orchestrator = std::make_unique<RetrievalOrchestrator>(*m_store, m_answerChain);
    return true;
}

void AdvisorService::seedIfEmpty()
{
    if (m_store->count() > 0 || m_settings.seedCatalogPath.isEmpty()) {
        return;
    }

    const auto stats = CatalogImporter::importFile(m_settings.seedCatalogPath, *m_store);
    if (!stats.has_value()) {
        LOG_WARN(paCatalog, "Seed catalog %s could not be imported",
                 qPrintable(m_settings.seedCatalogPath));
        return;
    }
    LOG_INFO(paCatalog, "Seeded catalog: %d imported, %d skipped",
             stats->imported, stats->skipped);
}

QJsonObject AdvisorService::handleAsk(uint64_t id, const QJsonObject& params)
{
    const QString question = params.value(QStringLiteral("question")).toString().trimmed();
    if (question.size() < m_settings.minQuestionLength) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Question must be at least %1 characters")
                                         .arg(m_settings.minQuestionLength));
    }

    if (!ensureStoreOpen()) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog is not available"));
    }

    const RetrievalResult retrieval = m_orchestrator->retrieve(question);
    const AnswerResult answer = m_answerChain.answer(retrieval);

    QJsonArray phones;
    for (const PhoneRecord& record : retrieval.records) {
        phones.append(record.modelName);
    }

    QJsonObject result;
    result[QStringLiteral("answer")] = answer.text;
    result[QStringLiteral("intent")] = intentToString(retrieval.analysis.intent);
    result[QStringLiteral("phones")] = phones;
    result[QStringLiteral("producedBy")] = answer.producedBy;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject AdvisorService::handleListPhones(uint64_t id)
{
    if (!ensureStoreOpen()) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog is not available"));
    }

    QJsonArray phones;
    for (const PhoneRecord& record : m_store->listAll()) {
        phones.append(phoneRecordToJson(record));
    }

    QJsonObject result;
    result[QStringLiteral("phones")] = phones;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject AdvisorService::handleGetPhone(uint64_t id, const QJsonObject& params)
{
    const QString modelName = params.value(QStringLiteral("modelName")).toString().trimmed();
    if (modelName.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("modelName is required"));
    }
    if (!ensureStoreOpen()) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog is not available"));
    }

    const std::optional<PhoneRecord> record = m_store->findByName(modelName);
    if (!record) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Phone not found: %1").arg(modelName));
    }

    QJsonObject result;
    result[QStringLiteral("phone")] = phoneRecordToJson(*record);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject AdvisorService::handleGetHealth(uint64_t id)
{
    const bool open = ensureStoreOpen();

    QJsonObject result;
    result[QStringLiteral("status")] = open ? QStringLiteral("healthy") : QStringLiteral("degraded");
    result[QStringLiteral("database")] = open ? QStringLiteral("connected") : QStringLiteral("unavailable");
    result[QStringLiteral("phoneCount")] = open ? m_store->count() : 0;
    return IpcMessage::makeResponse(id, result);
}

} // namespace pa
