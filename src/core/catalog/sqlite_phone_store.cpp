#include "core/catalog/sqlite_phone_store.h"
#include "core/catalog/schema.h"
#include "core/ranking/spec_parser.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

namespace pa {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, model_name, release_date, display, battery, camera, ram, storage, "
    "price, chipset, os, body, url FROM phones";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? QString::fromUtf8(reinterpret_cast<const char*>(text)) : QString();
}

PhoneRecord readRow(sqlite3_stmt* stmt)
{
    PhoneRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.modelName = columnText(stmt, 1);
    record.releaseDate = columnText(stmt, 2);
    record.display = columnText(stmt, 3);
    record.battery = columnText(stmt, 4);
    record.camera = columnText(stmt, 5);
    record.ram = columnText(stmt, 6);
    record.storage = columnText(stmt, 7);
    record.price = columnText(stmt, 8);
    record.chipset = columnText(stmt, 9);
    record.os = columnText(stmt, 10);
    record.body = columnText(stmt, 11);
    record.url = columnText(stmt, 12);
    return record;
}

// "Samsung Galaxy S24 Ultra" -> "s24 ultra"
QString withoutBrandWords(const QString& lowerName)
{
    static const QRegularExpression kBrandWords(QStringLiteral(R"(\b(samsung|galaxy)\b)"));
    QString stripped = lowerName;
    stripped.remove(kBrandWords);
    return stripped.simplified();
}

} // namespace

SQLitePhoneStore::~SQLitePhoneStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLitePhoneStore> SQLitePhoneStore::open(const QString& dbPath)
{
    SQLitePhoneStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLitePhoneStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(paCatalog, "Failed to open catalog: %s", sqlite3_errmsg(m_db));
        return false;
    }

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(paCatalog, "Failed to set connection pragmas");
        return false;
    }

    if (dbPath != QLatin1String(":memory:") && !execSql(kDatabasePragmas)) {
        LOG_WARN(paCatalog, "Failed to set database pragmas; continuing with defaults");
    }

    if (!execSql(kSchemaV1)) {
        LOG_ERROR(paCatalog, "Failed to create catalog schema");
        return false;
    }

    LOG_INFO(paCatalog, "Catalog opened: %s", dbPath.toUtf8().constData());
    return true;
}

bool SQLitePhoneStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(paCatalog, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

std::optional<int64_t> SQLitePhoneStore::upsertPhone(const PhoneRecord& record)
{
    const QString modelName = record.modelName.trimmed();
    if (modelName.isEmpty()) {
        LOG_WARN(paCatalog, "upsertPhone: refusing record without model name");
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO phones (model_name, release_date, display, battery, camera, ram,
                            storage, price, chipset, os, body, url)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)
        ON CONFLICT(model_name) DO UPDATE SET
            release_date = excluded.release_date,
            display = excluded.display,
            battery = excluded.battery,
            camera = excluded.camera,
            ram = excluded.ram,
            storage = excluded.storage,
            price = excluded.price,
            chipset = excluded.chipset,
            os = excluded.os,
            body = excluded.body,
            url = excluded.url
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(paCatalog, "upsertPhone prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray values[] = {
        modelName.toUtf8(),
        record.releaseDate.toUtf8(),
        record.display.toUtf8(),
        record.battery.toUtf8(),
        record.camera.toUtf8(),
        record.ram.toUtf8(),
        record.storage.toUtf8(),
        record.price.toUtf8(),
        record.chipset.toUtf8(),
        record.os.toUtf8(),
        record.body.toUtf8(),
        record.url.toUtf8(),
    };
    int index = 1;
    for (const QByteArray& value : values) {
        sqlite3_bind_text(stmt, index++, value.constData(), -1, SQLITE_STATIC);
    }

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(paCatalog, "upsertPhone failed for %s: %s",
                  qUtf8Printable(modelName), sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    // last_insert_rowid is not updated on the conflict path; look the row up.
    const QByteArray byNameSql = QByteArray(kSelectColumns) + " WHERE model_name = ?1";
    const auto row = findOne(byNameSql.constData(), modelName);
    if (!row.has_value()) {
        LOG_ERROR(paCatalog, "upsertPhone: row not found after successful upsert for %s",
                  qUtf8Printable(modelName));
        return std::nullopt;
    }
    return row->id;
}

bool SQLitePhoneStore::deleteAll()
{
    return execSql("DELETE FROM phones");
}

std::optional<PhoneRecord> SQLitePhoneStore::findOne(const char* sql, const QString& argument) const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(paCatalog, "findOne prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray argumentUtf8 = argument.toUtf8();
    sqlite3_bind_text(stmt, 1, argumentUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<PhoneRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

QStringList SQLitePhoneStore::listAllNames() const
{
    QStringList names;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT model_name FROM phones ORDER BY id",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(paCatalog, "listAllNames prepare failed: %s", sqlite3_errmsg(m_db));
        return names;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        names.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return names;
}

std::optional<PhoneRecord> SQLitePhoneStore::findByName(const QString& name) const
{
    const QString lowerName = name.trimmed().toLower();
    if (lowerName.isEmpty()) {
        return std::nullopt;
    }

    const QByteArray base(kSelectColumns);
    const QByteArray exactSql = base + " WHERE lower(model_name) = ?1 ORDER BY id LIMIT 1";
    const QByteArray containsSql = base + " WHERE instr(lower(model_name), ?1) > 0 ORDER BY id LIMIT 1";

    if (auto exact = findOne(exactSql.constData(), lowerName)) {
        return exact;
    }
    if (auto contains = findOne(containsSql.constData(), lowerName)) {
        return contains;
    }

    const QString stripped = withoutBrandWords(lowerName);
    if (!stripped.isEmpty() && stripped != lowerName) {
        if (auto relaxed = findOne(containsSql.constData(), stripped)) {
            return relaxed;
        }
    }

    LOG_DEBUG(paCatalog, "findByName: no record for '%s'", qUtf8Printable(name));
    return std::nullopt;
}

std::vector<PhoneRecord> SQLitePhoneStore::listAll() const
{
    std::vector<PhoneRecord> records;
    const QByteArray sql = QByteArray(kSelectColumns) + " ORDER BY id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(paCatalog, "listAll prepare failed: %s", sqlite3_errmsg(m_db));
        return records;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(readRow(stmt));
    }
    sqlite3_finalize(stmt);
    return records;
}

std::vector<PhoneRecord> SQLitePhoneStore::filterByMaxPrice(double priceMax, int limit) const
{
    std::vector<PhoneRecord> filtered;
    if (limit <= 0) {
        return filtered;
    }

    // Prices are free text, so the predicate runs on parsed values here
    // rather than in SQL.
    for (PhoneRecord& record : listAll()) {
        const auto price = SpecParser::priceUsd(record.price);
        if (!price.has_value() || *price > priceMax) {
            continue;
        }
        filtered.push_back(std::move(record));
        if (static_cast<int>(filtered.size()) >= limit) {
            break;
        }
    }
    return filtered;
}

int SQLitePhoneStore::count() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM phones", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(paCatalog, "count prepare failed: %s", sqlite3_errmsg(m_db));
        return 0;
    }
    int total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return total;
}

} // namespace pa
