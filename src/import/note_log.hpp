#pragma once

#include "core/note.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quire::import {

/**
 * LogNote - a snapshot of a note taken when its outcome was decided.
 * Fields are plain text; media references are kept as " <filename> ".
 */
struct LogNote {
    NoteId id;
    std::vector<std::string> fields;

    bool operator==(const LogNote&) const = default;
};

[[nodiscard]] LogNote into_log_note(const Note& note);

/**
 * NoteLog - outcome of a merge session, per note and in input order.
 */
struct NoteLog {
    std::vector<LogNote> new_notes;
    std::vector<LogNote> updated;
    std::vector<LogNote> duplicate;
    std::vector<LogNote> conflicting;
    size_t found_notes{0};

    [[nodiscard]] size_t logged_count() const {
        return new_notes.size() + updated.size() + duplicate.size() + conflicting.size();
    }
};

using NoteIdMap = std::unordered_map<NoteId, NoteId>;

/**
 * NoteImports - the import log together with the map from source note ids
 * to the ids the notes have in the target collection.
 *
 * Cards of the source package are later re-pointed through `id_map`, so a
 * note that was renumbered on insertion stays reachable under its source
 * id. Conflicting notes get no entry: their cards have no safe target.
 */
class NoteImports {
public:
    /**
     * `note` carries its stored id; `source_id` is the id it arrived with.
     */
    void log_new(const Note& note, NoteId source_id);

    /**
     * `note` carries the id of the target note it overwrote.
     */
    void log_updated(const Note& note, NoteId source_id);

    /**
     * `incoming` is left in place of the stored note `target_id`.
     */
    void log_duplicate(const Note& incoming, NoteId target_id);

    void log_conflicting(const Note& incoming);

    void set_found_notes(size_t count) { log_.found_notes = count; }

    [[nodiscard]] std::optional<NoteId> target_for(NoteId source_id) const;

    [[nodiscard]] const NoteIdMap& id_map() const { return id_map_; }
    [[nodiscard]] const NoteLog& log() const { return log_; }

private:
    NoteIdMap id_map_;
    NoteLog log_;
};

} // namespace quire::import
