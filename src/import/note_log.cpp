#include "import/note_log.hpp"
#include "core/text.hpp"

namespace quire::import {

LogNote into_log_note(const Note& note) {
    LogNote logged{.id = note.id, .fields = {}};
    logged.fields.reserve(note.fields.size());
    for (const auto& field : note.fields) {
        logged.fields.push_back(strip_html_preserving_media_filenames(field));
    }
    return logged;
}

void NoteImports::log_new(const Note& note, NoteId source_id) {
    id_map_.insert_or_assign(source_id, note.id);
    log_.new_notes.push_back(into_log_note(note));
}

void NoteImports::log_updated(const Note& note, NoteId source_id) {
    id_map_.insert_or_assign(source_id, note.id);
    log_.updated.push_back(into_log_note(note));
}

void NoteImports::log_duplicate(const Note& incoming, NoteId target_id) {
    id_map_.insert_or_assign(incoming.id, target_id);
    auto logged = into_log_note(incoming);
    logged.id = target_id;
    log_.duplicate.push_back(std::move(logged));
}

void NoteImports::log_conflicting(const Note& incoming) {
    log_.conflicting.push_back(into_log_note(incoming));
}

std::optional<NoteId> NoteImports::target_for(NoteId source_id) const {
    auto it = id_map_.find(source_id);
    if (it == id_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace quire::import
