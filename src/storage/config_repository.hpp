#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>

namespace quire::storage {

/**
 * Keys of collection-scoped settings.
 */
namespace config_keys {
    inline constexpr const char* NORMALIZE_NOTE_TEXT = "normalize_note_text";
    inline constexpr const char* USN = "usn";
}

/**
 * ConfigRepository - key/value settings stored in the collection.
 *
 * Values are stored as text; typed getters fall back to the supplied
 * default when a key is missing or does not parse.
 */
class ConfigRepository {
public:
    explicit ConfigRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<std::string>, Error> get(const std::string& key);

    [[nodiscard]] Result<void, Error> set(const std::string& key, const std::string& value);

    [[nodiscard]] Result<bool, Error> get_bool(const std::string& key, bool default_value);

    [[nodiscard]] Result<void, Error> set_bool(const std::string& key, bool value);

    [[nodiscard]] Result<int64_t, Error> get_int(const std::string& key, int64_t default_value);

    [[nodiscard]] Result<void, Error> set_int(const std::string& key, int64_t value);

private:
    Database& db_;
};

} // namespace quire::storage
