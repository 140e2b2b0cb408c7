#pragma once

#include <QByteArray>
#include <QString>

#include "core/result.hpp"
#include "import/media_map.hpp"

namespace quire::app {

struct MergeOptions {
    QString targetPath;
    QString sourcePath;
    QString mediaMapPath;
    bool json = false;
};

/**
 * Parse a media map: a JSON object mapping the file names notes refer to
 * onto the names the files have in the target collection. Both sides are
 * normalized; entries are indexed in document order.
 */
[[nodiscard]] Result<import::MediaUseMap> parse_media_map(const QByteArray& json);

/**
 * Merge the source collection into the target inside one transaction and
 * render the outcome (summary or JSON).
 */
[[nodiscard]] Result<QString> run_merge(const MergeOptions& options);

/**
 * Notetype and note counts of a collection.
 */
[[nodiscard]] Result<QString> run_stats(const QString& path);

} // namespace quire::app
