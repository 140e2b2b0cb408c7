#include "core/note.hpp"
#include "core/hashing.hpp"
#include "core/text.hpp"

#include <sstream>

namespace quire {

std::string join_fields(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out.push_back(FIELD_SEPARATOR);
        out += fields[i];
    }
    return out;
}

std::vector<std::string> split_fields(std::string_view joined) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        const auto pos = joined.find(FIELD_SEPARATOR, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(joined.substr(start));
            break;
        }
        fields.emplace_back(joined.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::string join_tags(const std::vector<std::string>& tags) {
    if (tags.empty()) return {};
    std::string out = " ";
    for (const auto& tag : tags) {
        out += tag;
        out.push_back(' ');
    }
    return out;
}

std::vector<std::string> split_tags(std::string_view joined) {
    std::vector<std::string> tags;
    std::istringstream stream{std::string(joined)};
    std::string tag;
    while (stream >> tag) {
        tags.push_back(tag);
    }
    return tags;
}

void fix_field_count(Note& note, size_t expected) {
    if (expected == 0) return;

    if (note.fields.size() < expected) {
        note.fields.resize(expected);
        return;
    }

    while (note.fields.size() > expected) {
        auto surplus = std::move(note.fields.back());
        note.fields.pop_back();
        auto& last = note.fields.back();
        if (!surplus.empty()) {
            if (!last.empty()) last += "; ";
            last += surplus;
        }
    }
}

uint32_t field_checksum(std::string_view text) {
    const auto digest = digest_of(strip_html_preserving_media_filenames(text));
    return (static_cast<uint32_t>(digest[0]) << 24) |
           (static_cast<uint32_t>(digest[1]) << 16) |
           (static_cast<uint32_t>(digest[2]) << 8) |
           static_cast<uint32_t>(digest[3]);
}

void prepare_for_update(Note& note, const Notetype& notetype, bool normalize_text) {
    fix_field_count(note, notetype.fields.size());

    if (normalize_text) {
        for (auto& field : note.fields) {
            field = normalize_to_nfc(field);
        }
    }

    if (note.fields.empty()) {
        note.sort_field.clear();
        note.checksum = field_checksum("");
        return;
    }

    const auto sort_idx = notetype.sort_field_idx < note.fields.size()
        ? notetype.sort_field_idx
        : 0;
    note.sort_field = strip_html_preserving_media_filenames(note.fields[sort_idx]);
    note.checksum = field_checksum(note.fields.front());
}

} // namespace quire
