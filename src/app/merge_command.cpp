#include "app/merge_command.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

#include "app/log_format.hpp"
#include "core/text.hpp"
#include "import/import_context.hpp"
#include "storage/collection.hpp"

namespace quire::app {

Q_LOGGING_CATEGORY(lcCli, "quire.cli")

namespace {

[[nodiscard]] std::string to_std(const QString& s) {
    return s.toStdString();
}

[[nodiscard]] Result<storage::Collection> open_existing(const QString& path, const char* role) {
    if (path.trimmed().isEmpty()) {
        return Result<storage::Collection>::err(Error::invalid_input(
            std::string("No ") + role + " collection given"));
    }
    if (!QFileInfo::exists(path)) {
        return Result<storage::Collection>::err(Error::not_found(
            std::string(role) + " collection " + to_std(path)));
    }
    return storage::Collection::open_read_only(to_std(path));
}

[[nodiscard]] bool same_file(const QString& a, const QString& b) {
    const auto canonical = QFileInfo(a).canonicalFilePath();
    return !canonical.isEmpty() && canonical == QFileInfo(b).canonicalFilePath();
}

[[nodiscard]] Result<import::ImportData> load_import_data(storage::Collection& source) {
    auto notetypes = source.all_notetypes();
    if (notetypes.is_err()) {
        return Result<import::ImportData>::err(notetypes.unwrap_err());
    }
    auto notes = source.all_notes();
    if (notes.is_err()) {
        return Result<import::ImportData>::err(notes.unwrap_err());
    }
    return Result<import::ImportData>::ok(import::ImportData{
        .notetypes = std::move(notetypes).unwrap(),
        .notes = std::move(notes).unwrap()
    });
}

[[nodiscard]] Result<import::MediaUseMap> load_media_map(const QString& path) {
    if (path.isEmpty()) {
        return Result<import::MediaUseMap>::ok(import::MediaUseMap{});
    }
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<import::MediaUseMap>::err(Error::invalid_input(
            "Cannot read media map " + to_std(path) + ": " + to_std(file.errorString())));
    }
    return parse_media_map(file.readAll());
}

} // namespace

Result<import::MediaUseMap> parse_media_map(const QByteArray& json) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<import::MediaUseMap>::err(Error::invalid_input(
            "Invalid media map: " + to_std(parse_error.errorString())));
    }
    if (!doc.isObject()) {
        return Result<import::MediaUseMap>::err(Error::invalid_input(
            "Invalid media map: expected a JSON object"));
    }

    import::MediaUseMap media_map;
    const auto obj = doc.object();
    size_t index = 0;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it, ++index) {
        if (!it.value().isString()) {
            return Result<import::MediaUseMap>::err(Error::invalid_input(
                "Invalid media map: value for " + to_std(it.key()) + " is not a string"));
        }
        auto referenced = safe_normalized_file_name(to_std(it.key()));
        if (referenced.is_err()) {
            return Result<import::MediaUseMap>::err(referenced.unwrap_err());
        }
        auto target = safe_normalized_file_name(to_std(it.value().toString()));
        if (target.is_err()) {
            return Result<import::MediaUseMap>::err(target.unwrap_err());
        }
        media_map.add_checked(std::move(referenced).unwrap(), import::SafeMediaEntry{
            .name = std::move(target).unwrap(),
            .index = index,
            .is_used = false
        });
    }
    return Result<import::MediaUseMap>::ok(std::move(media_map));
}

Result<QString> run_merge(const MergeOptions& options) {
    if (same_file(options.sourcePath, options.targetPath)) {
        return Result<QString>::err(Error::invalid_input(
            "Source and target are the same collection: " + to_std(options.targetPath)));
    }

    auto source = open_existing(options.sourcePath, "Source");
    if (source.is_err()) {
        return Result<QString>::err(source.unwrap_err());
    }
    auto data = load_import_data(source.unwrap());
    if (data.is_err()) {
        return Result<QString>::err(data.unwrap_err());
    }

    auto media_map = load_media_map(options.mediaMapPath);
    if (media_map.is_err()) {
        return Result<QString>::err(media_map.unwrap_err());
    }

    if (options.targetPath.trimmed().isEmpty()) {
        return Result<QString>::err(Error::invalid_input("No target collection given"));
    }
    auto target = storage::Collection::open(to_std(options.targetPath));
    if (target.is_err()) {
        return Result<QString>::err(target.unwrap_err());
    }
    auto& collection = target.unwrap();

    import::ThrottlingProgressHandler progress([](const import::ImportProgress& p) {
        qCDebug(lcCli) << "processed" << p.count
                       << (p.stage == import::ImportStage::Notetypes ? "notetypes" : "notes");
        return true;
    });

    qCInfo(lcCli) << "merging" << options.sourcePath << "into" << options.targetPath;
    auto& media = media_map.unwrap();
    auto merged = collection.db().transaction([&]() {
        return import::import_notes_and_notetypes(
            collection, std::move(data).unwrap(), media, progress);
    });
    if (merged.is_err()) {
        qCWarning(lcCli) << "merge aborted:" << QString::fromStdString(merged.unwrap_err().message);
        return Result<QString>::err(merged.unwrap_err());
    }

    const auto used_media = media.used_entries();
    const auto& imports = merged.unwrap();
    return Result<QString>::ok(options.json
        ? format_import_json(imports, used_media)
        : format_import_summary(imports, used_media));
}

Result<QString> run_stats(const QString& path) {
    auto opened = open_existing(path, "Target");
    if (opened.is_err()) {
        return Result<QString>::err(opened.unwrap_err());
    }
    auto& collection = opened.unwrap();

    auto notetypes = collection.notetypes().count();
    if (notetypes.is_err()) {
        return Result<QString>::err(notetypes.unwrap_err());
    }
    auto notes = collection.notes().count();
    if (notes.is_err()) {
        return Result<QString>::err(notes.unwrap_err());
    }
    return Result<QString>::ok(QStringLiteral("Notetypes: %1\nNotes: %2\n")
        .arg(notetypes.unwrap())
        .arg(notes.unwrap()));
}

} // namespace quire::app
