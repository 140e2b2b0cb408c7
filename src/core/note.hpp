#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "core/notetype.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace quire {

constexpr char FIELD_SEPARATOR = '\x1f';

/**
 * Note - a record of field strings shaped by a notetype.
 *
 * `id` is unique within one collection only; `guid` is the durable
 * identity used to recognize the same note across collections.
 * `sort_field` and `checksum` are derived by prepare_for_update().
 */
struct Note {
    NoteId id;
    std::string guid;
    NotetypeId notetype_id;
    TimestampSecs mtime;
    Usn usn;
    std::vector<std::string> tags;
    std::vector<std::string> fields;
    std::string sort_field;
    uint32_t checksum{0};

    bool operator==(const Note&) const = default;
};

/**
 * NoteMeta - the slice of a stored note needed to match incoming notes by
 * GUID without loading the full record.
 */
struct NoteMeta {
    NoteId id;
    TimestampSecs mtime;
    NotetypeId notetype_id;

    bool operator==(const NoteMeta&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a note with the given fields and a fresh GUID.
 */
[[nodiscard]] inline Note create_note(
    NoteId id,
    NotetypeId notetype_id,
    std::vector<std::string> fields,
    std::vector<std::string> tags = {}
) {
    return Note{
        .id = id,
        .guid = generate_guid(),
        .notetype_id = notetype_id,
        .mtime = TimestampSecs::now(),
        .usn = Usn{},
        .tags = std::move(tags),
        .fields = std::move(fields),
        .sort_field = {},
        .checksum = 0
    };
}

[[nodiscard]] std::string join_fields(const std::vector<std::string>& fields);

[[nodiscard]] std::vector<std::string> split_fields(std::string_view joined);

/**
 * Tags are stored space-separated with a leading and trailing space so
 * that "% tag %" LIKE patterns match whole tags.
 */
[[nodiscard]] std::string join_tags(const std::vector<std::string>& tags);

[[nodiscard]] std::vector<std::string> split_tags(std::string_view joined);

/**
 * Make the field count match the notetype: missing fields are added empty,
 * surplus fields are appended to the last one separated by "; ".
 */
void fix_field_count(Note& note, size_t expected);

/**
 * 32-bit checksum of the HTML-stripped first field.
 */
[[nodiscard]] uint32_t field_checksum(std::string_view text);

/**
 * Get a note ready to be written under `notetype`: field count fixed,
 * optional NFC normalization, derived sort field and checksum.
 */
void prepare_for_update(Note& note, const Notetype& notetype, bool normalize_text);

} // namespace quire
