#include "storage/collection.hpp"
#include "storage/migrations.hpp"

#include <QDebug>
#include <QString>

#include <limits>
#include <unordered_set>

namespace quire::storage {

namespace {

[[nodiscard]] std::string fold_case(const std::string& tag) {
    return QString::fromStdString(tag).toCaseFolded().toStdString();
}

[[nodiscard]] bool same_content(const Note& a, const Note& b) {
    return a.notetype_id == b.notetype_id &&
           a.fields == b.fields &&
           a.tags == b.tags;
}

} // namespace

Result<Collection, Error> Collection::from_database(Result<Database, Error> opened) {
    if (opened.is_err()) {
        return Result<Collection, Error>::err(opened.unwrap_err());
    }
    auto db = std::make_unique<Database>(std::move(opened).unwrap());
    auto migrated = initialize_database(*db);
    if (migrated.is_err()) {
        return Result<Collection, Error>::err(migrated.unwrap_err());
    }
    return Result<Collection, Error>::ok(Collection(std::move(db)));
}

Result<Collection, Error> Collection::open(const std::string& path) {
    qDebug() << "Collection: Opening database at" << QString::fromStdString(path);
    return from_database(Database::open(path));
}

Result<Collection, Error> Collection::open_memory() {
    return from_database(Database::open_memory());
}

Result<Collection, Error> Collection::open_read_only(const std::string& path) {
    qDebug() << "Collection: Opening database read-only at" << QString::fromStdString(path);
    auto opened = Database::open_read_only(path);
    if (opened.is_err()) {
        return Result<Collection, Error>::err(opened.unwrap_err());
    }
    auto db = std::make_unique<Database>(std::move(opened).unwrap());

    auto version = MigrationRunner(*db).stored_version();
    if (version.is_err()) {
        return Result<Collection, Error>::err(version.unwrap_err());
    }
    if (version.unwrap() != MigrationRunner::latest_version()) {
        return Result<Collection, Error>::err(Error::invalid_input(
            path + " has schema version " + std::to_string(version.unwrap()) +
            ", expected " + std::to_string(MigrationRunner::latest_version())));
    }
    return Result<Collection, Error>::ok(Collection(std::move(db)));
}

// ============================================================================
// Configuration
// ============================================================================

Result<Usn, Error> Collection::usn() {
    constexpr int64_t default_usn = -1;
    return config().get_int(config_keys::USN, default_usn).map([](int64_t value) {
        if (value < std::numeric_limits<int32_t>::min() ||
            value > std::numeric_limits<int32_t>::max()) {
            qWarning() << "Collection: usn" << value << "out of range, using" << default_usn;
            value = default_usn;
        }
        return Usn{static_cast<int32_t>(value)};
    });
}

Result<bool, Error> Collection::normalize_note_text() {
    return config().get_bool(config_keys::NORMALIZE_NOTE_TEXT, true);
}

// ============================================================================
// Notetypes
// ============================================================================

Result<std::optional<Notetype>, Error> Collection::get_notetype(NotetypeId id) {
    return notetypes().get(id);
}

Result<Notetype, Error> Collection::expect_notetype(NotetypeId id) {
    return or_not_found(get_notetype(id), "Notetype " + id.to_string());
}

Result<std::vector<Notetype>, Error> Collection::all_notetypes() {
    return notetypes().get_all();
}

Result<void, Error> Collection::ensure_notetype_name_unique(Notetype& notetype) {
    auto repo = notetypes();
    const auto original_name = notetype.name;
    while (true) {
        auto existing = repo.id_for_name(notetype.name);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        const auto& owner = existing.unwrap();
        if (!owner || *owner == notetype.id) {
            break;
        }
        notetype.name += "+";
    }
    if (notetype.name != original_name) {
        qWarning() << "Collection: Notetype name" << QString::fromStdString(original_name)
                   << "already in use, renamed to" << QString::fromStdString(notetype.name);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Collection::add_notetype_with_existing_id(Notetype& notetype, Usn usn) {
    auto prepared = prepare_for_update(notetype);
    if (prepared.is_err()) return prepared;

    auto unique = ensure_notetype_name_unique(notetype);
    if (unique.is_err()) return unique;

    notetype.usn = usn;
    return notetypes().insert(notetype);
}

Result<void, Error> Collection::add_notetype_with_new_id(Notetype& notetype, Usn usn) {
    auto prepared = prepare_for_update(notetype);
    if (prepared.is_err()) return prepared;

    auto repo = notetypes();
    auto fresh_id = repo.next_free_id();
    if (fresh_id.is_err()) {
        return Result<void, Error>::err(fresh_id.unwrap_err());
    }
    notetype.id = fresh_id.unwrap();

    auto unique = ensure_notetype_name_unique(notetype);
    if (unique.is_err()) return unique;

    notetype.usn = usn;
    return repo.insert(notetype);
}

Result<void, Error> Collection::update_notetype(Notetype& notetype,
                                                const Notetype& original,
                                                Usn usn) {
    notetype.id = original.id;

    auto prepared = prepare_for_update(notetype);
    if (prepared.is_err()) return prepared;

    auto unique = ensure_notetype_name_unique(notetype);
    if (unique.is_err()) return unique;

    notetype.usn = usn;
    return notetypes().update(notetype);
}

// ============================================================================
// Notes
// ============================================================================

Result<std::optional<Note>, Error> Collection::get_note(NoteId id) {
    return notes().get(id);
}

Result<std::vector<Note>, Error> Collection::all_notes() {
    return notes().get_all();
}

Result<std::unordered_set<NoteId>, Error> Collection::all_note_ids() {
    return notes().all_ids();
}

Result<GuidIndex, Error> Collection::note_guid_index() {
    return notes().guid_index();
}

Result<void, Error> Collection::canonify_note_tags(Note& note, Usn usn) {
    std::vector<std::string> words;
    for (const auto& tag : note.tags) {
        for (auto& word : split_tags(tag)) {
            words.push_back(std::move(word));
        }
    }

    auto registry = tags();
    std::unordered_set<std::string> seen;
    std::vector<std::string> canonical;
    for (auto& word : words) {
        if (!seen.insert(fold_case(word)).second) {
            continue;
        }

        auto registered = registry.registered_spelling(word);
        if (registered.is_err()) {
            return Result<void, Error>::err(registered.unwrap_err());
        }
        if (registered.unwrap()) {
            canonical.push_back(*registered.unwrap());
            continue;
        }

        auto added = registry.register_tag(word, usn);
        if (added.is_err()) return added;
        canonical.push_back(std::move(word));
    }

    note.tags = std::move(canonical);
    return Result<void, Error>::ok();
}

Result<void, Error> Collection::add_note_with_id(const Note& note) {
    return notes().insert(note);
}

Result<void, Error> Collection::update_note(Note& note,
                                            const Note& original,
                                            const Notetype& notetype,
                                            Usn usn,
                                            bool normalize_text) {
    note.id = original.id;

    auto canonified = canonify_note_tags(note, usn);
    if (canonified.is_err()) return canonified;

    prepare_for_update(note, notetype, normalize_text);
    if (same_content(note, original)) {
        return Result<void, Error>::ok();
    }

    note.mtime = TimestampSecs::now();
    note.usn = usn;
    return notes().update(note);
}

} // namespace quire::storage
