#include "storage/notetype_repository.hpp"

#include <algorithm>

namespace quire::storage {

namespace {

constexpr std::string_view SELECT_NOTETYPE = R"SQL(
    SELECT id, name, kind, css, sort_field_idx, mtime_secs, usn
    FROM notetypes
)SQL";

} // namespace

Notetype NotetypeRepository::row_to_notetype(Statement& stmt) {
    return Notetype{
        .id = NotetypeId(stmt.column_int64(0)),
        .name = stmt.column_text(1),
        .kind = stmt.column_int(2) == 1 ? NotetypeKind::Cloze : NotetypeKind::Normal,
        .fields = {},
        .templates = {},
        .css = stmt.column_text(3),
        .sort_field_idx = static_cast<uint32_t>(stmt.column_int(4)),
        .mtime = TimestampSecs(stmt.column_int64(5)),
        .usn = Usn{stmt.column_int(6)}
    };
}

Result<void, Error> NotetypeRepository::load_children(Notetype& notetype) {
    auto fields_stmt = db_.prepare(R"SQL(
        SELECT ord, name, font_name, font_size, sticky
        FROM fields WHERE ntid = ? ORDER BY ord;
    )SQL");
    if (fields_stmt.is_err()) {
        return Result<void, Error>::err(fields_stmt.unwrap_err());
    }
    fields_stmt.unwrap().bind_id(1, notetype.id);
    auto fields_result = Database::for_each_row(fields_stmt.unwrap(), [&](Statement& row) {
        notetype.fields.push_back(NoteField{
            .name = row.column_text(1),
            .ord = static_cast<uint32_t>(row.column_int(0)),
            .font_name = row.column_text(2),
            .font_size = static_cast<uint32_t>(row.column_int(3)),
            .sticky = row.column_int(4) != 0
        });
    });
    if (fields_result.is_err()) {
        return fields_result;
    }

    auto templates_stmt = db_.prepare(R"SQL(
        SELECT ord, name, qfmt, afmt
        FROM templates WHERE ntid = ? ORDER BY ord;
    )SQL");
    if (templates_stmt.is_err()) {
        return Result<void, Error>::err(templates_stmt.unwrap_err());
    }
    templates_stmt.unwrap().bind_id(1, notetype.id);
    return Database::for_each_row(templates_stmt.unwrap(), [&](Statement& row) {
        notetype.templates.push_back(CardTemplate{
            .name = row.column_text(1),
            .ord = static_cast<uint32_t>(row.column_int(0)),
            .question_format = row.column_text(2),
            .answer_format = row.column_text(3)
        });
    });
}

Result<void, Error> NotetypeRepository::write_children(const Notetype& notetype) {
    auto clear_fields = db_.prepare("DELETE FROM fields WHERE ntid = ?;");
    if (clear_fields.is_err()) {
        return Result<void, Error>::err(clear_fields.unwrap_err());
    }
    auto cleared = clear_fields.unwrap().bind_id(1, notetype.id).run();
    if (cleared.is_err()) return cleared;

    auto clear_templates = db_.prepare("DELETE FROM templates WHERE ntid = ?;");
    if (clear_templates.is_err()) {
        return Result<void, Error>::err(clear_templates.unwrap_err());
    }
    cleared = clear_templates.unwrap().bind_id(1, notetype.id).run();
    if (cleared.is_err()) return cleared;

    auto field_stmt = db_.prepare(R"SQL(
        INSERT INTO fields (ntid, ord, name, font_name, font_size, sticky)
        VALUES (?, ?, ?, ?, ?, ?);
    )SQL");
    if (field_stmt.is_err()) {
        return Result<void, Error>::err(field_stmt.unwrap_err());
    }
    auto& insert_field = field_stmt.unwrap();
    for (const auto& field : notetype.fields) {
        auto reset = insert_field.reset();
        if (reset.is_err()) return reset;
        insert_field.bind_id(1, notetype.id)
            .bind_int(2, static_cast<int>(field.ord))
            .bind_text(3, field.name)
            .bind_text(4, field.font_name)
            .bind_int(5, static_cast<int>(field.font_size))
            .bind_int(6, field.sticky ? 1 : 0);
        auto inserted = insert_field.run();
        if (inserted.is_err()) return inserted;
    }

    auto template_stmt = db_.prepare(R"SQL(
        INSERT INTO templates (ntid, ord, name, qfmt, afmt)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (template_stmt.is_err()) {
        return Result<void, Error>::err(template_stmt.unwrap_err());
    }
    auto& insert_template = template_stmt.unwrap();
    for (const auto& tmpl : notetype.templates) {
        auto reset = insert_template.reset();
        if (reset.is_err()) return reset;
        insert_template.bind_id(1, notetype.id)
            .bind_int(2, static_cast<int>(tmpl.ord))
            .bind_text(3, tmpl.name)
            .bind_text(4, tmpl.question_format)
            .bind_text(5, tmpl.answer_format);
        auto inserted = insert_template.run();
        if (inserted.is_err()) return inserted;
    }

    return Result<void, Error>::ok();
}

Result<std::optional<Notetype>, Error> NotetypeRepository::get(NotetypeId id) {
    auto stmt_result = db_.prepare(std::string(SELECT_NOTETYPE) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Notetype>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_id(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Notetype>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Notetype>, Error>::ok(std::nullopt);
    }

    auto notetype = row_to_notetype(stmt);
    auto children = load_children(notetype);
    if (children.is_err()) {
        return Result<std::optional<Notetype>, Error>::err(children.unwrap_err());
    }
    return Result<std::optional<Notetype>, Error>::ok(std::move(notetype));
}

Result<std::vector<Notetype>, Error> NotetypeRepository::get_all() {
    std::vector<Notetype> notetypes;
    auto query_result = db_.query(std::string(SELECT_NOTETYPE) + " ORDER BY id;",
        [&](Statement& stmt) { notetypes.push_back(row_to_notetype(stmt)); });
    if (query_result.is_err()) {
        return Result<std::vector<Notetype>, Error>::err(query_result.unwrap_err());
    }

    for (auto& notetype : notetypes) {
        auto children = load_children(notetype);
        if (children.is_err()) {
            return Result<std::vector<Notetype>, Error>::err(children.unwrap_err());
        }
    }
    return Result<std::vector<Notetype>, Error>::ok(std::move(notetypes));
}

Result<std::optional<NotetypeId>, Error> NotetypeRepository::id_for_name(const std::string& name) {
    auto stmt_result = db_.prepare("SELECT id FROM notetypes WHERE name = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<NotetypeId>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<NotetypeId>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<NotetypeId>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<NotetypeId>, Error>::ok(NotetypeId(stmt.column_int64(0)));
}

Result<void, Error> NotetypeRepository::insert(const Notetype& notetype) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO notetypes (id, name, kind, css, sort_field_idx, mtime_secs, usn)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_id(1, notetype.id)
        .bind_text(2, notetype.name)
        .bind_int(3, static_cast<int>(notetype.kind))
        .bind_text(4, notetype.css)
        .bind_int(5, static_cast<int>(notetype.sort_field_idx))
        .bind_int64(6, notetype.mtime.secs())
        .bind_int(7, notetype.usn.value);

    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return run_result;
    }
    return write_children(notetype);
}

Result<void, Error> NotetypeRepository::update(const Notetype& notetype) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE notetypes
        SET name = ?, kind = ?, css = ?, sort_field_idx = ?, mtime_secs = ?, usn = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, notetype.name)
        .bind_int(2, static_cast<int>(notetype.kind))
        .bind_text(3, notetype.css)
        .bind_int(4, static_cast<int>(notetype.sort_field_idx))
        .bind_int64(5, notetype.mtime.secs())
        .bind_int(6, notetype.usn.value)
        .bind_id(7, notetype.id);

    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return run_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error::not_found("Notetype " + notetype.id.to_string()));
    }
    return write_children(notetype);
}

Result<NotetypeId, Error> NotetypeRepository::next_free_id() {
    int64_t max_id = 0;
    auto query_result = db_.query("SELECT COALESCE(MAX(id), 0) FROM notetypes;",
        [&](Statement& stmt) { max_id = stmt.column_int64(0); });
    if (query_result.is_err()) {
        return Result<NotetypeId, Error>::err(query_result.unwrap_err());
    }
    return Result<NotetypeId, Error>::ok(NotetypeId(std::max(now_millis(), max_id + 1)));
}

Result<int64_t, Error> NotetypeRepository::count() {
    int64_t total = 0;
    auto query_result = db_.query("SELECT COUNT(*) FROM notetypes;",
        [&](Statement& stmt) { total = stmt.column_int64(0); });
    if (query_result.is_err()) {
        return Result<int64_t, Error>::err(query_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

} // namespace quire::storage
