#pragma once

#include <QString>
#include <vector>

#include "import/media_map.hpp"
#include "import/note_log.hpp"

namespace quire::app {

// Plain text summary: one line per outcome count, followed by the number of
// media files the merge made use of.
[[nodiscard]] QString format_import_summary(const import::NoteImports& imports,
                                            const std::vector<import::SafeMediaEntry>& used_media);

// JSON output:
// {
//   "foundNotes": n,
//   "new" | "updated" | "duplicate" | "conflicting": [{ "id", "fields": [..] }],
//   "idMap": { "<source id>": <target id> },
//   "media": ["<file name>", ...]
// }
[[nodiscard]] QString format_import_json(const import::NoteImports& imports,
                                         const std::vector<import::SafeMediaEntry>& used_media);

} // namespace quire::app
