#pragma once

#include "core/shared/phone_record.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace pa {

// Read API the retrieval core depends on. Listing order is stable
// (insertion order) so resolver ties break the same way on every call.
class PhoneCatalog {
public:
    virtual ~PhoneCatalog() = default;

    virtual QStringList listAllNames() const = 0;

    // Case-insensitive exact match, then substring, then substring with the
    // "samsung"/"galaxy" words removed. nullopt when nothing matches.
    virtual std::optional<PhoneRecord> findByName(const QString& name) const = 0;

    // Records whose parsed price is <= priceMax, at most limit of them.
    virtual std::vector<PhoneRecord> filterByMaxPrice(double priceMax, int limit) const = 0;

    virtual std::vector<PhoneRecord> listAll() const = 0;

    virtual int count() const = 0;
};

} // namespace pa
