#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(paCore, "phoneadvisor.core")
Q_LOGGING_CATEGORY(paCatalog, "phoneadvisor.catalog")
Q_LOGGING_CATEGORY(paQuery, "phoneadvisor.query")
Q_LOGGING_CATEGORY(paRanking, "phoneadvisor.ranking")
Q_LOGGING_CATEGORY(paAnswer, "phoneadvisor.answer")
Q_LOGGING_CATEGORY(paIpc, "phoneadvisor.ipc")
