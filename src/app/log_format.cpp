#include "app/log_format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include <algorithm>
#include <utility>

namespace quire::app {

namespace {

[[nodiscard]] QJsonObject log_note_to_json(const import::LogNote& note) {
    QJsonArray fields;
    for (const auto& field : note.fields) {
        fields.append(QString::fromStdString(field));
    }
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(note.id.value()));
    obj.insert(QStringLiteral("fields"), fields);
    return obj;
}

[[nodiscard]] QJsonArray log_notes_to_json(const std::vector<import::LogNote>& notes) {
    QJsonArray out;
    for (const auto& note : notes) {
        out.append(log_note_to_json(note));
    }
    return out;
}

[[nodiscard]] QJsonObject id_map_to_json(const import::NoteIdMap& id_map) {
    // Sorted so the output is stable between runs.
    std::vector<std::pair<NoteId, NoteId>> entries(id_map.begin(), id_map.end());
    std::sort(entries.begin(), entries.end());

    QJsonObject out;
    for (const auto& [source, target] : entries) {
        out.insert(QString::number(source.value()), static_cast<qint64>(target.value()));
    }
    return out;
}

[[nodiscard]] QString count_line(const QString& label, size_t count) {
    return QStringLiteral("%1: %2").arg(label).arg(count);
}

} // namespace

QString format_import_summary(const import::NoteImports& imports,
                              const std::vector<import::SafeMediaEntry>& used_media) {
    const auto& log = imports.log();

    QStringList out;
    out.append(count_line(QStringLiteral("Notes found"), log.found_notes));
    out.append(count_line(QStringLiteral("New"), log.new_notes.size()));
    out.append(count_line(QStringLiteral("Updated"), log.updated.size()));
    out.append(count_line(QStringLiteral("Duplicate"), log.duplicate.size()));
    out.append(count_line(QStringLiteral("Conflicting"), log.conflicting.size()));
    out.append(count_line(QStringLiteral("Media files used"), used_media.size()));
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_import_json(const import::NoteImports& imports,
                           const std::vector<import::SafeMediaEntry>& used_media) {
    const auto& log = imports.log();

    QJsonArray media;
    for (const auto& entry : used_media) {
        media.append(QString::fromStdString(entry.name));
    }

    QJsonObject root;
    root.insert(QStringLiteral("foundNotes"), static_cast<qint64>(log.found_notes));
    root.insert(QStringLiteral("new"), log_notes_to_json(log.new_notes));
    root.insert(QStringLiteral("updated"), log_notes_to_json(log.updated));
    root.insert(QStringLiteral("duplicate"), log_notes_to_json(log.duplicate));
    root.insert(QStringLiteral("conflicting"), log_notes_to_json(log.conflicting));
    root.insert(QStringLiteral("idMap"), id_map_to_json(imports.id_map()));
    root.insert(QStringLiteral("media"), media);

    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace quire::app
