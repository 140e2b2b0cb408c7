#include "import/import_context.hpp"
#include "import/schema_fingerprint.hpp"

#include <QString>

namespace quire::import {

Result<void, Error> ImportContext::import_notetypes(std::vector<Notetype> notetypes,
                                                    ThrottlingProgressHandler& progress) {
    Incrementor incrementor(progress, ImportStage::Notetypes);
    for (auto& notetype : notetypes) {
        auto step = incrementor.increment();
        if (step.is_err()) return step;

        auto imported = import_notetype(std::move(notetype));
        if (imported.is_err()) return imported;
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ImportContext::import_notetype(Notetype notetype) {
    auto existing = target_.get_notetype(notetype.id);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }

    if (existing.unwrap()) {
        return merge_or_remap_notetype(notetype, *existing.unwrap());
    }

    qCDebug(lcImport) << "notetype" << notetype.id.value() << "added";
    return target_.add_notetype_with_existing_id(notetype, usn_);
}

Result<void, Error> ImportContext::merge_or_remap_notetype(Notetype& incoming,
                                                           const Notetype& existing) {
    const auto incoming_hash = schema_hash(incoming);
    const auto existing_hash = schema_hash(existing);
    if (incoming_hash != existing_hash) {
        qCDebug(lcImport) << "notetype" << existing.id.value() << "schema"
                          << QString::fromStdString(to_hex(existing_hash)) << "differs from incoming"
                          << QString::fromStdString(to_hex(incoming_hash));
        return add_notetype_with_remapped_id(incoming);
    }

    if (incoming.mtime > existing.mtime) {
        qCDebug(lcImport) << "notetype" << existing.id.value() << "updated in place";
        return target_.update_notetype(incoming, existing, usn_);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ImportContext::add_notetype_with_remapped_id(Notetype& notetype) {
    const auto old_id = notetype.id;
    auto added = target_.add_notetype_with_new_id(notetype, usn_);
    if (added.is_err()) return added;

    qCDebug(lcImport) << "notetype" << old_id.value() << "diverged, added as"
                      << notetype.id.value();
    remapped_notetypes_.insert_or_assign(old_id, notetype.id);
    return Result<void, Error>::ok();
}

} // namespace quire::import
