#include "storage/migrations.hpp"

namespace quire::storage {

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    int version = 0;
    auto query_result = db_.query(
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;",
        [&](Statement& stmt) { version = stmt.column_int(0); });
    if (query_result.is_err()) {
        return Result<int, Error>::err(query_result.unwrap_err());
    }
    return Result<int, Error>::ok(version);
}

Result<int, Error> MigrationRunner::stored_version() {
    bool has_table = false;
    auto table_result = db_.query(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'schema_migrations';",
        [&](Statement&) { has_table = true; });
    if (table_result.is_err()) {
        return Result<int, Error>::err(table_result.unwrap_err());
    }
    if (!has_table) {
        return Result<int, Error>::ok(0);
    }

    int version = 0;
    auto query_result = db_.query(
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;",
        [&](Statement& stmt) { version = stmt.column_int(0); });
    if (query_result.is_err()) {
        return Result<int, Error>::err(query_result.unwrap_err());
    }
    return Result<int, Error>::ok(version);
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        const auto& cause = exec_result.unwrap_err();
        return Result<void, Error>::err(Error::storage(
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            cause.message, cause.code));
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, m.version)
        .bind_text(2, m.name)
        .bind_int64(3, TimestampSecs::now().secs());
    return stmt.run();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    const int current = current_result.unwrap();
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current || m.version > target_version) continue;
            auto result = apply(m);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace quire::storage
