#pragma once

#include "storage/database.hpp"
#include "core/notetype.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>

namespace quire::storage {

/**
 * NotetypeRepository - Data access layer for notetypes, their fields and
 * their templates.
 */
class NotetypeRepository {
public:
    explicit NotetypeRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Notetype>, Error> get(NotetypeId id);

    [[nodiscard]] Result<std::vector<Notetype>, Error> get_all();

    /**
     * Look up a notetype id by exact name.
     */
    [[nodiscard]] Result<std::optional<NotetypeId>, Error> id_for_name(const std::string& name);

    /**
     * Insert a notetype under its own id. Fails if the id or the name is taken.
     */
    [[nodiscard]] Result<void, Error> insert(const Notetype& notetype);

    /**
     * Replace a stored notetype, including its fields and templates.
     * Fails with NotFound if no notetype has this id.
     */
    [[nodiscard]] Result<void, Error> update(const Notetype& notetype);

    /**
     * An unused id: the current time in milliseconds, or one past the
     * largest stored id if that is later.
     */
    [[nodiscard]] Result<NotetypeId, Error> next_free_id();

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> load_children(Notetype& notetype);
    [[nodiscard]] Result<void, Error> write_children(const Notetype& notetype);
    [[nodiscard]] Notetype row_to_notetype(Statement& stmt);
};

} // namespace quire::storage
