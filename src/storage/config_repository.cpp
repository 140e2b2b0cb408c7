#include "storage/config_repository.hpp"

#include <charconv>

namespace quire::storage {

Result<std::optional<std::string>, Error> ConfigRepository::get(const std::string& key) {
    auto stmt_result = db_.prepare("SELECT val FROM config WHERE key = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, key);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>, Error>::ok(stmt.column_text(0));
}

Result<void, Error> ConfigRepository::set(const std::string& key, const std::string& value) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO config (key, val, mtime_secs) VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET
            val = excluded.val,
            mtime_secs = excluded.mtime_secs;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, key)
        .bind_text(2, value)
        .bind_int64(3, TimestampSecs::now().secs());
    return stmt.run();
}

Result<bool, Error> ConfigRepository::get_bool(const std::string& key, bool default_value) {
    return get(key).map([default_value](const std::optional<std::string>& value) {
        if (!value) return default_value;
        if (*value == "true" || *value == "1") return true;
        if (*value == "false" || *value == "0") return false;
        return default_value;
    });
}

Result<void, Error> ConfigRepository::set_bool(const std::string& key, bool value) {
    return set(key, value ? "true" : "false");
}

Result<int64_t, Error> ConfigRepository::get_int(const std::string& key, int64_t default_value) {
    return get(key).map([default_value](const std::optional<std::string>& value) {
        if (!value) return default_value;
        int64_t parsed = 0;
        const auto* end = value->data() + value->size();
        const auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
        if (ec != std::errc{} || ptr != end) return default_value;
        return parsed;
    });
}

Result<void, Error> ConfigRepository::set_int(const std::string& key, int64_t value) {
    return set(key, std::to_string(value));
}

} // namespace quire::storage
