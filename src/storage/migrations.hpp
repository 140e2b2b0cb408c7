#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace quire::storage {

/**
 * Migration - one forward step of the collection schema.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "notetypes_and_notes",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS notetypes (
                id INTEGER PRIMARY KEY,
                name TEXT NOT NULL,
                kind INTEGER NOT NULL DEFAULT 0,
                css TEXT NOT NULL DEFAULT '',
                sort_field_idx INTEGER NOT NULL DEFAULT 0,
                mtime_secs INTEGER NOT NULL,
                usn INTEGER NOT NULL
            );
            CREATE UNIQUE INDEX IF NOT EXISTS idx_notetypes_name ON notetypes(name);

            CREATE TABLE IF NOT EXISTS fields (
                ntid INTEGER NOT NULL REFERENCES notetypes(id) ON DELETE CASCADE,
                ord INTEGER NOT NULL,
                name TEXT NOT NULL,
                font_name TEXT NOT NULL DEFAULT 'Arial',
                font_size INTEGER NOT NULL DEFAULT 20,
                sticky INTEGER NOT NULL DEFAULT 0,
                PRIMARY KEY (ntid, ord)
            );

            CREATE TABLE IF NOT EXISTS templates (
                ntid INTEGER NOT NULL REFERENCES notetypes(id) ON DELETE CASCADE,
                ord INTEGER NOT NULL,
                name TEXT NOT NULL,
                qfmt TEXT NOT NULL DEFAULT '',
                afmt TEXT NOT NULL DEFAULT '',
                PRIMARY KEY (ntid, ord)
            );

            -- guid is deliberately not unique: imports may carry repeats
            CREATE TABLE IF NOT EXISTS notes (
                id INTEGER PRIMARY KEY,
                guid TEXT NOT NULL,
                mid INTEGER NOT NULL,
                mod INTEGER NOT NULL,
                usn INTEGER NOT NULL,
                tags TEXT NOT NULL DEFAULT '',
                flds TEXT NOT NULL,
                sfld TEXT NOT NULL DEFAULT '',
                csum INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_notes_guid ON notes(guid);
            CREATE INDEX IF NOT EXISTS idx_notes_mid ON notes(mid);
            CREATE INDEX IF NOT EXISTS idx_notes_csum ON notes(csum);
        )SQL"
    },
    {
        .version = 2,
        .name = "tags_and_config",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS tags (
                tag TEXT NOT NULL PRIMARY KEY COLLATE NOCASE,
                usn INTEGER NOT NULL
            );

            CREATE TABLE IF NOT EXISTS config (
                key TEXT NOT NULL PRIMARY KEY,
                val TEXT NOT NULL,
                mtime_secs INTEGER NOT NULL DEFAULT 0
            );
        )SQL"
    }
};

/**
 * MigrationRunner - brings a collection database up to the latest schema.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Run pending migrations up to and including `target_version`.
     */
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    /**
     * Version recorded in the database, without creating the bookkeeping
     * table. Works on read-only connections.
     */
    [[nodiscard]] Result<int, Error> stored_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> apply(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace quire::storage
