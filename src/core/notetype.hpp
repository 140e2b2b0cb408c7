#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace quire {

enum class NotetypeKind {
    Normal = 0,
    Cloze = 1
};

/**
 * NoteField - one field definition of a notetype.
 */
struct NoteField {
    std::string name;
    uint32_t ord{0};
    std::string font_name{"Arial"};
    uint32_t font_size{20};
    bool sticky{false};

    bool operator==(const NoteField&) const = default;
};

/**
 * CardTemplate - one card template of a notetype.
 */
struct CardTemplate {
    std::string name;
    uint32_t ord{0};
    std::string question_format;
    std::string answer_format;

    bool operator==(const CardTemplate&) const = default;
};

/**
 * Notetype - the schema shared by a family of notes.
 *
 * Structural identity is the ordered list of field names followed by the
 * ordered list of template names; everything else (styling, template
 * bodies, fonts) is content that may be overwritten by a newer version.
 */
struct Notetype {
    NotetypeId id;
    std::string name;
    NotetypeKind kind{NotetypeKind::Normal};
    std::vector<NoteField> fields;
    std::vector<CardTemplate> templates;
    std::string css;
    uint32_t sort_field_idx{0};
    TimestampSecs mtime;
    Usn usn;

    bool operator==(const Notetype&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a notetype with the given field and template names.
 * Templates reference the first field on the front and the second (if any)
 * on the back.
 */
[[nodiscard]] Notetype create_notetype(
    NotetypeId id,
    std::string name,
    const std::vector<std::string>& field_names,
    const std::vector<std::string>& template_names
);

/**
 * The stock two-field "Basic" notetype.
 */
[[nodiscard]] inline Notetype basic_notetype(NotetypeId id, std::string name = "Basic") {
    return create_notetype(id, std::move(name), {"Front", "Back"}, {"Card 1"});
}

[[nodiscard]] std::vector<std::string> field_names(const Notetype& notetype);

[[nodiscard]] std::vector<std::string> template_names(const Notetype& notetype);

/**
 * Validate a notetype and normalize its bookkeeping before it is stored:
 * ordinals follow positions and the sort field index is kept in range.
 * Fails with InvalidInput for a notetype without fields or templates, or
 * with an unnamed field or template.
 */
[[nodiscard]] Result<void, Error> prepare_for_update(Notetype& notetype);

} // namespace quire
