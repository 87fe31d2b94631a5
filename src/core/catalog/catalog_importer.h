#pragma once

#include <QJsonArray>
#include <QString>

#include <optional>

namespace pa {

class SQLitePhoneStore;

struct CatalogImportStats {
    int imported = 0;
    int skipped = 0;
};

// Seeds a catalog from JSON: either a top-level array of phone objects or an
// object with a "phones" array. Object keys follow phoneAttributeKey().
class CatalogImporter {
public:
    // nullopt when the file cannot be read or is not JSON of the expected
    // shape. Individual entries without a model name are skipped.
    static std::optional<CatalogImportStats> importFile(const QString& filePath,
                                                        SQLitePhoneStore& store);

    static CatalogImportStats importArray(const QJsonArray& phones, SQLitePhoneStore& store);
};

} // namespace pa
