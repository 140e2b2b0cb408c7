#pragma once

#include "storage/database.hpp"
#include "storage/note_repository.hpp"
#include "storage/notetype_repository.hpp"
#include "storage/tag_repository.hpp"
#include "storage/config_repository.hpp"
#include "core/note.hpp"
#include "core/notetype.hpp"
#include "core/result.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace quire::storage {

/**
 * Collection - a note collection stored in one SQLite database.
 *
 * Owns the connection and hands out repositories bound to it. The
 * higher-level operations below are what the merge engine needs from a
 * target collection; they apply the same preparation rules as any other
 * write (validation, name uniqueness, tag canonicalization, revision
 * stamping).
 */
class Collection {
public:
    /**
     * Open (or create) a collection file and bring its schema up to date.
     */
    [[nodiscard]] static Result<Collection, Error> open(const std::string& path);

    /**
     * Open an empty in-memory collection (for testing).
     */
    [[nodiscard]] static Result<Collection, Error> open_memory();

    /**
     * Open an existing collection for reading. The file is never migrated;
     * a schema older or newer than this build understands is InvalidInput.
     */
    [[nodiscard]] static Result<Collection, Error> open_read_only(const std::string& path);

    Collection(Collection&&) noexcept = default;
    Collection& operator=(Collection&&) noexcept = default;

    [[nodiscard]] Database& db() { return *db_; }

    [[nodiscard]] NotetypeRepository notetypes() { return NotetypeRepository(*db_); }
    [[nodiscard]] NoteRepository notes() { return NoteRepository(*db_); }
    [[nodiscard]] TagRepository tags() { return TagRepository(*db_); }
    [[nodiscard]] ConfigRepository config() { return ConfigRepository(*db_); }

    // ------------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------------

    /**
     * Revision counter stamped on records written by this collection.
     */
    [[nodiscard]] Result<Usn, Error> usn();

    [[nodiscard]] Result<bool, Error> normalize_note_text();

    // ------------------------------------------------------------------
    // Notetypes
    // ------------------------------------------------------------------

    [[nodiscard]] Result<std::optional<Notetype>, Error> get_notetype(NotetypeId id);

    /**
     * Fetch a notetype that must exist; NotFound otherwise.
     */
    [[nodiscard]] Result<Notetype, Error> expect_notetype(NotetypeId id);

    [[nodiscard]] Result<std::vector<Notetype>, Error> all_notetypes();

    /**
     * Rename `notetype` by appending "+" until no other notetype uses its name.
     */
    [[nodiscard]] Result<void, Error> ensure_notetype_name_unique(Notetype& notetype);

    /**
     * Store a notetype under the id it already carries.
     */
    [[nodiscard]] Result<void, Error> add_notetype_with_existing_id(Notetype& notetype, Usn usn);

    /**
     * Store a notetype under a freshly allocated id, which is written back
     * into `notetype`.
     */
    [[nodiscard]] Result<void, Error> add_notetype_with_new_id(Notetype& notetype, Usn usn);

    /**
     * Overwrite `original` with the content of `notetype`, keeping the
     * original id.
     */
    [[nodiscard]] Result<void, Error> update_notetype(Notetype& notetype,
                                                      const Notetype& original,
                                                      Usn usn);

    // ------------------------------------------------------------------
    // Notes
    // ------------------------------------------------------------------

    [[nodiscard]] Result<std::optional<Note>, Error> get_note(NoteId id);

    [[nodiscard]] Result<std::vector<Note>, Error> all_notes();

    [[nodiscard]] Result<std::unordered_set<NoteId>, Error> all_note_ids();

    [[nodiscard]] Result<GuidIndex, Error> note_guid_index();

    /**
     * Split, deduplicate and register the note's tags. Tags already known
     * in another case adopt the registered spelling.
     */
    [[nodiscard]] Result<void, Error> canonify_note_tags(Note& note, Usn usn);

    /**
     * Insert an already prepared note under its own id.
     */
    [[nodiscard]] Result<void, Error> add_note_with_id(const Note& note);

    /**
     * Prepare `note` and overwrite the stored `original` with it. The note
     * is stamped with the current time and `usn`; nothing is written if
     * the prepared note does not differ from the original.
     */
    [[nodiscard]] Result<void, Error> update_note(Note& note,
                                                  const Note& original,
                                                  const Notetype& notetype,
                                                  Usn usn,
                                                  bool normalize_text);

private:
    explicit Collection(std::unique_ptr<Database> db) : db_(std::move(db)) {}

    [[nodiscard]] static Result<Collection, Error> from_database(Result<Database, Error> opened);

    std::unique_ptr<Database> db_;
};

} // namespace quire::storage
