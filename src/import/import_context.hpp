#pragma once

#include "import/media_map.hpp"
#include "import/note_log.hpp"
#include "import/progress.hpp"
#include "storage/collection.hpp"
#include "core/note.hpp"
#include "core/notetype.hpp"
#include "core/result.hpp"

#include <QLoggingCategory>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quire::import {

Q_DECLARE_LOGGING_CATEGORY(lcImport)

/**
 * Step added to a new note's id until it no longer collides with a note
 * already in the target collection.
 */
constexpr int64_t NOTE_ID_COLLISION_STEP = 999;

using NotetypeIdMap = std::unordered_map<NotetypeId, NotetypeId>;

/**
 * ImportData - decoded records of a foreign package.
 */
struct ImportData {
    std::vector<Notetype> notetypes;
    std::vector<Note> notes;
};

/**
 * First id at or after `id` (in NOTE_ID_COLLISION_STEP increments) that is
 * not in `taken`. Fails with InvalidInput when the search would pass the
 * largest representable id.
 */
[[nodiscard]] Result<NoteId, Error> uniquify_note_id(NoteId id, const std::unordered_set<NoteId>& taken);

/**
 * Rewrite the media references of every field of `note` to the names the
 * files will have in the target collection. Entries that are resolved are
 * marked used in `media_map`.
 */
void rewrite_media_refs(Note& note, MediaUseMap& media_map);

/**
 * ImportContext - state of one merge session into a target collection.
 *
 * Holds the target's GUID index and note id set as they were when the
 * session started. GUID matching always uses that snapshot; the id set
 * grows as notes are inserted so later notes of the batch cannot collide
 * with earlier ones.
 *
 * Notetypes must be imported before notes: notes of a notetype whose
 * structure diverged are re-pointed at its new id.
 */
class ImportContext {
public:
    /**
     * Snapshot `target` and read its session settings (usn, text
     * normalization).
     */
    [[nodiscard]] static Result<ImportContext, Error> create(storage::Collection& target,
                                                            MediaUseMap& media_map);

    ImportContext(const ImportContext&) = delete;
    ImportContext& operator=(const ImportContext&) = delete;
    ImportContext(ImportContext&&) = default;

    [[nodiscard]] Result<void, Error> import_notetypes(std::vector<Notetype> notetypes,
                                                       ThrottlingProgressHandler& progress);

    [[nodiscard]] Result<void, Error> import_notes(std::vector<Note> notes,
                                                   ThrottlingProgressHandler& progress);

    [[nodiscard]] const NoteImports& imports() const { return imports_; }
    [[nodiscard]] NoteImports take_imports() { return std::move(imports_); }

    [[nodiscard]] const NotetypeIdMap& remapped_notetypes() const { return remapped_notetypes_; }

    [[nodiscard]] Usn usn() const { return usn_; }

private:
    ImportContext(storage::Collection& target,
                  MediaUseMap& media_map,
                  Usn usn,
                  bool normalize_notes,
                  storage::GuidIndex target_guids,
                  std::unordered_set<NoteId> target_ids);

    // Notetypes
    [[nodiscard]] Result<void, Error> import_notetype(Notetype notetype);
    [[nodiscard]] Result<void, Error> merge_or_remap_notetype(Notetype& incoming,
                                                              const Notetype& existing);
    [[nodiscard]] Result<void, Error> add_notetype_with_remapped_id(Notetype& notetype);

    // Notes
    [[nodiscard]] Result<void, Error> import_note(Note note);
    [[nodiscard]] Result<void, Error> add_note(Note note);
    [[nodiscard]] Result<void, Error> update_note(Note note, NoteId target_id);
    [[nodiscard]] Result<const Notetype*, Error> expected_notetype(NotetypeId id);

    storage::Collection& target_;
    MediaUseMap& media_map_;
    Usn usn_;
    bool normalize_notes_;
    storage::GuidIndex target_guids_;
    std::unordered_set<NoteId> target_ids_;
    std::unordered_set<std::string> added_guids_;
    std::unordered_map<NotetypeId, Notetype> notetype_cache_;
    NotetypeIdMap remapped_notetypes_;
    NoteImports imports_;
};

/**
 * Merge `data` into `target`: notetypes first, then notes in input order.
 * Runs in the caller's transaction; on error, writes already made are left
 * for the caller to roll back.
 */
[[nodiscard]] Result<NoteImports, Error> import_notes_and_notetypes(
    storage::Collection& target,
    ImportData data,
    MediaUseMap& media_map,
    ThrottlingProgressHandler& progress);

} // namespace quire::import
