#pragma once

#include "core/answer/answer_chain.h"
#include "core/catalog/sqlite_phone_store.h"
#include "core/ipc/service_base.h"
#include "core/retrieval/retrieval_orchestrator.h"
#include "core/shared/settings.h"

#include <memory>
#include <optional>

namespace pa {

class AdvisorService : public ServiceBase {
    Q_OBJECT
public:
    explicit AdvisorService(const Settings& settings, QObject* parent = nullptr);
    ~AdvisorService() override;

    // Builds the answer chain for the configured generators, primary first.
    static AnswerChain buildAnswerChain(const Settings& settings);

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;

private:
    QJsonObject handleAsk(uint64_t id, const QJsonObject& params);
    QJsonObject handleListPhones(uint64_t id);
    QJsonObject handleGetPhone(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetHealth(uint64_t id);

    // Opens the store on first use and seeds it when empty.
    bool ensureStoreOpen();
    void seedIfEmpty();

    Settings m_settings;
    AnswerChain m_answerChain;
    std::optional<SQLitePhoneStore> m_store;
    std::unique_ptr<RetrievalOrchestrator> m_orchestrator;
};

} // namespace pa
