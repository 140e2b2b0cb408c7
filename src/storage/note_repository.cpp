#include "storage/note_repository.hpp"

namespace quire::storage {

namespace {

constexpr std::string_view SELECT_NOTE = R"SQL(
    SELECT id, guid, mid, mod, usn, tags, flds, sfld, csum
    FROM notes
)SQL";

} // namespace

Note NoteRepository::row_to_note(Statement& stmt) {
    return Note{
        .id = NoteId(stmt.column_int64(0)),
        .guid = stmt.column_text(1),
        .notetype_id = NotetypeId(stmt.column_int64(2)),
        .mtime = TimestampSecs(stmt.column_int64(3)),
        .usn = Usn{stmt.column_int(4)},
        .tags = split_tags(stmt.column_text(5)),
        .fields = split_fields(stmt.column_text(6)),
        .sort_field = stmt.column_text(7),
        .checksum = static_cast<uint32_t>(stmt.column_int64(8))
    };
}

Result<std::optional<Note>, Error> NoteRepository::first_row(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Note>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Note>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Note>, Error>::ok(row_to_note(stmt));
}

Result<std::optional<Note>, Error> NoteRepository::get(NoteId id) {
    auto stmt_result = db_.prepare(std::string(SELECT_NOTE) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Note>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_id(1, id);
    return first_row(stmt);
}

Result<std::optional<Note>, Error> NoteRepository::get_by_guid(const std::string& guid) {
    auto stmt_result = db_.prepare(std::string(SELECT_NOTE) +
                                   " WHERE guid = ? ORDER BY id LIMIT 1;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Note>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, guid);
    return first_row(stmt);
}

Result<std::vector<Note>, Error> NoteRepository::get_all() {
    std::vector<Note> notes;
    auto query_result = db_.query(std::string(SELECT_NOTE) + " ORDER BY id;",
        [&](Statement& stmt) { notes.push_back(row_to_note(stmt)); });
    if (query_result.is_err()) {
        return Result<std::vector<Note>, Error>::err(query_result.unwrap_err());
    }
    return Result<std::vector<Note>, Error>::ok(std::move(notes));
}

Result<std::unordered_set<NoteId>, Error> NoteRepository::all_ids() {
    std::unordered_set<NoteId> ids;
    auto query_result = db_.query("SELECT id FROM notes;",
        [&](Statement& stmt) { ids.insert(NoteId(stmt.column_int64(0))); });
    if (query_result.is_err()) {
        return Result<std::unordered_set<NoteId>, Error>::err(query_result.unwrap_err());
    }
    return Result<std::unordered_set<NoteId>, Error>::ok(std::move(ids));
}

Result<GuidIndex, Error> NoteRepository::guid_index() {
    GuidIndex index;
    auto query_result = db_.query("SELECT guid, id, mod, mid FROM notes ORDER BY id;",
        [&](Statement& stmt) {
            index.emplace(stmt.column_text(0), NoteMeta{
                .id = NoteId(stmt.column_int64(1)),
                .mtime = TimestampSecs(stmt.column_int64(2)),
                .notetype_id = NotetypeId(stmt.column_int64(3))
            });
        });
    if (query_result.is_err()) {
        return Result<GuidIndex, Error>::err(query_result.unwrap_err());
    }
    return Result<GuidIndex, Error>::ok(std::move(index));
}

Result<void, Error> NoteRepository::insert(const Note& note) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO notes (id, guid, mid, mod, usn, tags, flds, sfld, csum)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_id(1, note.id)
        .bind_text(2, note.guid)
        .bind_id(3, note.notetype_id)
        .bind_int64(4, note.mtime.secs())
        .bind_int(5, note.usn.value)
        .bind_text(6, join_tags(note.tags))
        .bind_text(7, join_fields(note.fields))
        .bind_text(8, note.sort_field)
        .bind_int64(9, static_cast<int64_t>(note.checksum));
    return stmt.run();
}

Result<void, Error> NoteRepository::update(const Note& note) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE notes
        SET guid = ?, mid = ?, mod = ?, usn = ?, tags = ?, flds = ?, sfld = ?, csum = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, note.guid)
        .bind_id(2, note.notetype_id)
        .bind_int64(3, note.mtime.secs())
        .bind_int(4, note.usn.value)
        .bind_text(5, join_tags(note.tags))
        .bind_text(6, join_fields(note.fields))
        .bind_text(7, note.sort_field)
        .bind_int64(8, static_cast<int64_t>(note.checksum))
        .bind_id(9, note.id);

    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return run_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error::not_found("Note " + note.id.to_string()));
    }
    return Result<void, Error>::ok();
}

Result<int64_t, Error> NoteRepository::count() {
    int64_t total = 0;
    auto query_result = db_.query("SELECT COUNT(*) FROM notes;",
        [&](Statement& stmt) { total = stmt.column_int64(0); });
    if (query_result.is_err()) {
        return Result<int64_t, Error>::err(query_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

Result<int64_t, Error> NoteRepository::count_by_notetype(NotetypeId notetype_id) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM notes WHERE mid = ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_id(1, notetype_id);

    int64_t total = 0;
    auto rows = Database::for_each_row(stmt,
        [&](Statement& row) { total = row.column_int64(0); });
    if (rows.is_err()) {
        return Result<int64_t, Error>::err(rows.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

} // namespace quire::storage
