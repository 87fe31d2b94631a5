#pragma once

#include "core/catalog/phone_catalog.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace pa {

// SQLitePhoneStore -- owner of the catalog database connection.
// Reads are served straight from SQLite; nothing is cached between calls.
class SQLitePhoneStore : public PhoneCatalog {
public:
    ~SQLitePhoneStore() override;

    // Move-only (owns sqlite3* handle)
    SQLitePhoneStore(SQLitePhoneStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLitePhoneStore& operator=(SQLitePhoneStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLitePhoneStore(const SQLitePhoneStore&) = delete;
    SQLitePhoneStore& operator=(const SQLitePhoneStore&) = delete;

    // Open or create the catalog at the given path (":memory:" allowed).
    static std::optional<SQLitePhoneStore> open(const QString& dbPath);

    // ── PhoneCatalog ────────────────────────────────────────

    QStringList listAllNames() const override;
    std::optional<PhoneRecord> findByName(const QString& name) const override;
    std::vector<PhoneRecord> filterByMaxPrice(double priceMax, int limit) const override;
    std::vector<PhoneRecord> listAll() const override;
    int count() const override;

    // ── Writes (seeding only) ───────────────────────────────

    // Insert or update by model name. Returns the row id.
    std::optional<int64_t> upsertPhone(const PhoneRecord& record);
    bool deleteAll();

private:
    SQLitePhoneStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    std::optional<PhoneRecord> findOne(const char* sql, const QString& argument) const;

    sqlite3* m_db = nullptr;
};

} // namespace pa
