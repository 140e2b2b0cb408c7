#pragma once

#include "storage/database.hpp"
#include "core/note.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quire::storage {

using GuidIndex = std::unordered_map<std::string, NoteMeta>;

/**
 * NoteRepository - Data access layer for notes.
 */
class NoteRepository {
public:
    explicit NoteRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Note>, Error> get(NoteId id);

    /**
     * The lowest-id note with this GUID, if any.
     */
    [[nodiscard]] Result<std::optional<Note>, Error> get_by_guid(const std::string& guid);

    [[nodiscard]] Result<std::vector<Note>, Error> get_all();

    [[nodiscard]] Result<std::unordered_set<NoteId>, Error> all_ids();

    /**
     * GUID -> NoteMeta over every stored note. If a GUID occurs more than
     * once, the note with the lowest id is indexed.
     */
    [[nodiscard]] Result<GuidIndex, Error> guid_index();

    /**
     * Insert a note under its own id. Fails if the id is taken.
     */
    [[nodiscard]] Result<void, Error> insert(const Note& note);

    /**
     * Overwrite a stored note. Fails with NotFound if no note has this id.
     */
    [[nodiscard]] Result<void, Error> update(const Note& note);

    [[nodiscard]] Result<int64_t, Error> count();

    [[nodiscard]] Result<int64_t, Error> count_by_notetype(NotetypeId notetype_id);

private:
    Database& db_;

    [[nodiscard]] Note row_to_note(Statement& stmt);
    [[nodiscard]] Result<std::optional<Note>, Error> first_row(Statement& stmt);
};

} // namespace quire::storage
