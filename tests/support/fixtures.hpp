#pragma once

#include "core/hashing.hpp"
#include "core/note.hpp"
#include "core/notetype.hpp"
#include "import/progress.hpp"
#include "storage/collection.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace quire::testing {

/**
 * Empty, migrated in-memory collection.
 */
inline storage::Collection make_collection() {
    init_hashing().unwrap();
    return storage::Collection::open_memory().unwrap();
}

inline Note make_note(int64_t id,
                      NotetypeId notetype_id,
                      std::string guid,
                      int64_t mtime_secs,
                      std::vector<std::string> fields) {
    auto note = create_note(NoteId(id), notetype_id, std::move(fields));
    note.guid = std::move(guid);
    note.mtime = TimestampSecs(mtime_secs);
    return note;
}

/**
 * Store `note` as if it had been added earlier, fully prepared.
 */
inline void seed_note(storage::Collection& col, Note note) {
    const auto notetype = col.expect_notetype(note.notetype_id).unwrap();
    prepare_for_update(note, notetype, true);
    col.add_note_with_id(note).unwrap();
}

inline Notetype seed_notetype(storage::Collection& col, Notetype notetype) {
    col.add_notetype_with_existing_id(notetype, Usn{0}).unwrap();
    return notetype;
}

/**
 * Progress handler that forwards every update and never cancels.
 */
inline import::ThrottlingProgressHandler unthrottled_progress() {
    return import::ThrottlingProgressHandler(
        [](const import::ImportProgress&) { return true; },
        std::chrono::milliseconds{0});
}

} // namespace quire::testing
