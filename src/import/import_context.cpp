#include "import/import_context.hpp"

namespace quire::import {

Q_LOGGING_CATEGORY(lcImport, "quire.import")

ImportContext::ImportContext(storage::Collection& target,
                             MediaUseMap& media_map,
                             Usn usn,
                             bool normalize_notes,
                             storage::GuidIndex target_guids,
                             std::unordered_set<NoteId> target_ids)
    : target_(target),
      media_map_(media_map),
      usn_(usn),
      normalize_notes_(normalize_notes),
      target_guids_(std::move(target_guids)),
      target_ids_(std::move(target_ids)) {}

Result<ImportContext, Error> ImportContext::create(storage::Collection& target,
                                                   MediaUseMap& media_map) {
    auto usn = target.usn();
    if (usn.is_err()) {
        return Result<ImportContext, Error>::err(usn.unwrap_err());
    }
    auto normalize = target.normalize_note_text();
    if (normalize.is_err()) {
        return Result<ImportContext, Error>::err(normalize.unwrap_err());
    }
    auto guids = target.note_guid_index();
    if (guids.is_err()) {
        return Result<ImportContext, Error>::err(guids.unwrap_err());
    }
    auto ids = target.all_note_ids();
    if (ids.is_err()) {
        return Result<ImportContext, Error>::err(ids.unwrap_err());
    }

    qCDebug(lcImport) << "session start: target notes" << ids.unwrap().size()
                      << "usn" << usn.unwrap().value
                      << "normalize" << normalize.unwrap();

    return Result<ImportContext, Error>::ok(ImportContext(
        target,
        media_map,
        usn.unwrap(),
        normalize.unwrap(),
        std::move(guids).unwrap(),
        std::move(ids).unwrap()));
}

Result<NoteImports, Error> import_notes_and_notetypes(
    storage::Collection& target,
    ImportData data,
    MediaUseMap& media_map,
    ThrottlingProgressHandler& progress
) {
    auto ctx_result = ImportContext::create(target, media_map);
    if (ctx_result.is_err()) {
        return Result<NoteImports, Error>::err(ctx_result.unwrap_err());
    }
    auto ctx = std::move(ctx_result).unwrap();

    auto notetypes = ctx.import_notetypes(std::move(data.notetypes), progress);
    if (notetypes.is_err()) {
        return Result<NoteImports, Error>::err(notetypes.unwrap_err());
    }

    auto notes = ctx.import_notes(std::move(data.notes), progress);
    if (notes.is_err()) {
        return Result<NoteImports, Error>::err(notes.unwrap_err());
    }

    const auto& log = ctx.imports().log();
    qCInfo(lcImport) << "merged" << log.found_notes << "notes:"
                     << log.new_notes.size() << "new,"
                     << log.updated.size() << "updated,"
                     << log.duplicate.size() << "duplicate,"
                     << log.conflicting.size() << "conflicting;"
                     << ctx.remapped_notetypes().size() << "notetypes remapped";

    return Result<NoteImports, Error>::ok(ctx.take_imports());
}

} // namespace quire::import
