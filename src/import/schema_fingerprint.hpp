#pragma once

#include "core/hashing.hpp"
#include "core/notetype.hpp"

namespace quire::import {

using SchemaHash = Digest;

/**
 * Digest of a notetype's structure: its field names in order, then its
 * template names in order. Two notetypes with the same hash can share
 * notes; anything else about them (styling, template text, fonts) is
 * ignored.
 */
[[nodiscard]] SchemaHash schema_hash(const Notetype& notetype);

} // namespace quire::import
