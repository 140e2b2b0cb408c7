#include "storage/tag_repository.hpp"

namespace quire::storage {

Result<std::optional<std::string>, Error> TagRepository::registered_spelling(const std::string& tag) {
    auto stmt_result = db_.prepare("SELECT tag FROM tags WHERE tag = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, tag);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>, Error>::ok(stmt.column_text(0));
}

Result<void, Error> TagRepository::register_tag(const std::string& tag, Usn usn) {
    auto stmt_result = db_.prepare("INSERT OR IGNORE INTO tags (tag, usn) VALUES (?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, tag).bind_int(2, usn.value);
    return stmt.run();
}

Result<std::vector<std::string>, Error> TagRepository::get_all() {
    std::vector<std::string> tags;
    auto query_result = db_.query("SELECT tag FROM tags ORDER BY tag;",
        [&](Statement& stmt) { tags.push_back(stmt.column_text(0)); });
    if (query_result.is_err()) {
        return Result<std::vector<std::string>, Error>::err(query_result.unwrap_err());
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(tags));
}

} // namespace quire::storage
