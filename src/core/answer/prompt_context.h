#pragma once

#include "core/query/structured_query.h"
#include "core/shared/phone_record.h"

#include <QString>

#include <vector>

namespace pa {

struct RetrievalResult;

// What a generative backend gets to see.
struct PromptContext {
    QString question;
    Intent intent = Intent::General;
    CriteriaSet criteria;
    std::vector<PhoneRecord> records;  // capped at maxRecords

    static PromptContext fromRetrieval(const RetrievalResult& retrieval, int maxRecords);

    // Deterministic prompt text for the backend.
    QString render() const;
};

} // namespace pa
