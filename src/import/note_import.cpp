#include "import/import_context.hpp"
#include "core/text.hpp"

#include <QString>

#include <limits>

namespace quire::import {

Result<NoteId, Error> uniquify_note_id(NoteId id, const std::unordered_set<NoteId>& taken) {
    constexpr auto max_id = std::numeric_limits<int64_t>::max();
    auto candidate = id;
    while (taken.contains(candidate)) {
        if (candidate.value() > max_id - NOTE_ID_COLLISION_STEP) {
            return Result<NoteId, Error>::err(Error::invalid_input(
                "No free note id at or after " + id.to_string()));
        }
        candidate = NoteId(candidate.value() + NOTE_ID_COLLISION_STEP);
    }
    return Result<NoteId, Error>::ok(candidate);
}

void rewrite_media_refs(Note& note, MediaUseMap& media_map) {
    const MediaRefResolver resolver = [&media_map](const std::string& name)
        -> std::optional<std::string> {
        auto normalized = safe_normalized_file_name(name);
        if (normalized.is_err()) {
            return std::nullopt;
        }
        const auto& safe_name = normalized.unwrap();
        if (const auto* entry = media_map.use_entry(safe_name)) {
            if (entry->name != name) {
                return entry->name;
            }
            return std::nullopt;
        }
        if (safe_name != name) {
            return safe_name;
        }
        return std::nullopt;
    };

    for (auto& field : note.fields) {
        if (auto rewritten = replace_media_refs(field, resolver)) {
            field = std::move(*rewritten);
        }
    }
}

Result<void, Error> ImportContext::import_notes(std::vector<Note> notes,
                                                ThrottlingProgressHandler& progress) {
    Incrementor incrementor(progress, ImportStage::Notes);
    imports_.set_found_notes(notes.size());

    for (auto& note : notes) {
        auto step = incrementor.increment();
        if (step.is_err()) return step;

        auto imported = import_note(std::move(note));
        if (imported.is_err()) return imported;
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ImportContext::import_note(Note note) {
    const auto remapped = remapped_notetypes_.find(note.notetype_id);
    const bool notetype_remapped = remapped != remapped_notetypes_.end();

    const auto existing = target_guids_.find(note.guid);
    if (existing == target_guids_.end()) {
        if (notetype_remapped) {
            note.notetype_id = remapped->second;
        }
        return add_note(std::move(note));
    }

    const auto& meta = existing->second;
    if (meta.mtime >= note.mtime) {
        qCDebug(lcImport) << "note" << note.id.value() << "duplicate of" << meta.id.value();
        imports_.log_duplicate(note, meta.id);
        return Result<void, Error>::ok();
    }

    if (meta.notetype_id != note.notetype_id || notetype_remapped) {
        qCDebug(lcImport) << "note" << note.id.value() << "conflicts with" << meta.id.value();
        imports_.log_conflicting(note);
        return Result<void, Error>::ok();
    }

    return update_note(std::move(note), meta.id);
}

Result<void, Error> ImportContext::add_note(Note note) {
    if (!added_guids_.insert(note.guid).second) {
        qCWarning(lcImport) << "GUID" << QString::fromStdString(note.guid)
                            << "occurs more than once in the batch; adding note"
                            << note.id.value() << "as a separate note";
    }

    rewrite_media_refs(note, media_map_);

    auto tagged = target_.canonify_note_tags(note, usn_);
    if (tagged.is_err()) return tagged;

    auto notetype = expected_notetype(note.notetype_id);
    if (notetype.is_err()) {
        return Result<void, Error>::err(notetype.unwrap_err());
    }
    prepare_for_update(note, *notetype.unwrap(), normalize_notes_);
    note.usn = usn_;

    const auto source_id = note.id;
    auto free_id = uniquify_note_id(note.id, target_ids_);
    if (free_id.is_err()) {
        return Result<void, Error>::err(free_id.unwrap_err());
    }
    note.id = free_id.unwrap();
    if (note.id != source_id) {
        qCDebug(lcImport) << "note id" << source_id.value() << "taken, stored as"
                          << note.id.value();
    }

    auto inserted = target_.add_note_with_id(note);
    if (inserted.is_err()) return inserted;

    target_ids_.insert(note.id);
    imports_.log_new(note, source_id);
    return Result<void, Error>::ok();
}

Result<void, Error> ImportContext::update_note(Note note, NoteId target_id) {
    const auto source_id = note.id;
    note.id = target_id;

    rewrite_media_refs(note, media_map_);

    auto original = or_not_found(target_.get_note(target_id), "Note " + target_id.to_string());
    if (original.is_err()) {
        return Result<void, Error>::err(original.unwrap_err());
    }
    auto notetype = expected_notetype(note.notetype_id);
    if (notetype.is_err()) {
        return Result<void, Error>::err(notetype.unwrap_err());
    }

    auto updated = target_.update_note(note, original.unwrap(), *notetype.unwrap(),
                                       usn_, normalize_notes_);
    if (updated.is_err()) return updated;

    qCDebug(lcImport) << "note" << source_id.value() << "updated" << target_id.value();
    imports_.log_updated(note, source_id);
    return Result<void, Error>::ok();
}

Result<const Notetype*, Error> ImportContext::expected_notetype(NotetypeId id) {
    if (auto cached = notetype_cache_.find(id); cached != notetype_cache_.end()) {
        return Result<const Notetype*, Error>::ok(&cached->second);
    }

    auto fetched = target_.expect_notetype(id);
    if (fetched.is_err()) {
        return Result<const Notetype*, Error>::err(fetched.unwrap_err());
    }
    auto it = notetype_cache_.emplace(id, std::move(fetched).unwrap()).first;
    return Result<const Notetype*, Error>::ok(&it->second);
}

} // namespace quire::import
