#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quire::storage {

/**
 * TagRepository - the collection's tag registry.
 *
 * Tags compare case-insensitively; the registry remembers the spelling a
 * tag was first registered with.
 */
class TagRepository {
public:
    explicit TagRepository(Database& db) : db_(db) {}

    /**
     * The registered spelling of `tag`, if it is known in any case.
     */
    [[nodiscard]] Result<std::optional<std::string>, Error> registered_spelling(const std::string& tag);

    /**
     * Register a tag; a tag that is already registered (in any case) is left alone.
     */
    [[nodiscard]] Result<void, Error> register_tag(const std::string& tag, Usn usn);

    [[nodiscard]] Result<std::vector<std::string>, Error> get_all();

private:
    Database& db_;
};

} // namespace quire::storage
