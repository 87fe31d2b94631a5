#pragma once

namespace pa {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, run once when creating a file-backed catalog.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA user_version = 1;
)";

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS phones (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    model_name TEXT NOT NULL UNIQUE,
    release_date TEXT NOT NULL DEFAULT '',
    display TEXT NOT NULL DEFAULT '',
    battery TEXT NOT NULL DEFAULT '',
    camera TEXT NOT NULL DEFAULT '',
    ram TEXT NOT NULL DEFAULT '',
    storage TEXT NOT NULL DEFAULT '',
    price TEXT NOT NULL DEFAULT '',
    chipset TEXT NOT NULL DEFAULT '',
    os TEXT NOT NULL DEFAULT '',
    body TEXT NOT NULL DEFAULT '',
    url TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_phones_model_name_lower ON phones(lower(model_name));
)";

} // namespace pa
