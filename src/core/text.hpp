#pragma once

#include "core/result.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

/**
 * Called with the (unescaped) filename of each media reference; returns the
 * name to write in its place, or nullopt to keep the reference as is.
 */
using MediaRefResolver = std::function<std::optional<std::string>(const std::string&)>;

/**
 * Rewrite the media references embedded in note field text.
 *
 * Recognized references are the src attribute of <img>, <audio> and
 * <source> tags, the data attribute of <object> tags, and [sound:name]
 * tags. HTML attribute values are unescaped before being passed to the
 * resolver and replacement names are escaped on the way back.
 *
 * Returns nullopt if no reference was replaced.
 */
[[nodiscard]] std::optional<std::string> replace_media_refs(
    std::string_view text,
    const MediaRefResolver& resolver);

/**
 * List the filenames referenced by a field, in order of appearance.
 */
[[nodiscard]] std::vector<std::string> extract_media_refs(std::string_view text);

/**
 * Normalize a media filename to NFC and remove characters that are not
 * legal in filenames. Fails for names that cannot be stored safely
 * (empty, path separators, "." / "..", reserved device names).
 */
[[nodiscard]] Result<std::string, Error> safe_normalized_file_name(std::string_view name);

/**
 * Unicode NFC normalization of UTF-8 text.
 */
[[nodiscard]] std::string normalize_to_nfc(std::string_view text);

/**
 * Remove tags, comments, style and script blocks; decode entities.
 */
[[nodiscard]] std::string strip_html(std::string_view html);

/**
 * As strip_html, but media references are kept as " <filename> ".
 */
[[nodiscard]] std::string strip_html_preserving_media_filenames(std::string_view html);

[[nodiscard]] std::string decode_entities(std::string_view html);

[[nodiscard]] std::string escape_attribute(std::string_view text);

} // namespace quire
