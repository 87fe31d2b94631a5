#include "core/catalog/catalog_importer.h"
#include "core/catalog/sqlite_phone_store.h"
#include "core/shared/logging.h"
#include "core/shared/phone_record.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace pa {

std::optional<CatalogImportStats> CatalogImporter::importFile(const QString& filePath,
                                                              SQLitePhoneStore& store)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(paCatalog, "Failed to open seed catalog: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(paCatalog, "Failed to parse seed catalog (%s): %s",
                 qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    QJsonArray phones;
    if (doc.isArray()) {
        phones = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("phones")).isArray()) {
        phones = doc.object().value(QStringLiteral("phones")).toArray();
    } else {
        LOG_WARN(paCatalog, "Seed catalog has no phone array: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const CatalogImportStats stats = importArray(phones, store);
    LOG_INFO(paCatalog, "Imported %d phone(s) from %s (%d skipped)",
             stats.imported, qUtf8Printable(filePath), stats.skipped);
    return stats;
}

CatalogImportStats CatalogImporter::importArray(const QJsonArray& phones, SQLitePhoneStore& store)
{
    CatalogImportStats stats;
    for (const QJsonValue& value : phones) {
        if (!value.isObject()) {
            ++stats.skipped;
            continue;
        }

        const PhoneRecord record = phoneRecordFromJson(value.toObject());
        if (record.modelName.isEmpty() || !store.upsertPhone(record).has_value()) {
            ++stats.skipped;
            continue;
        }
        ++stats.imported;
    }
    return stats;
}

} // namespace pa
