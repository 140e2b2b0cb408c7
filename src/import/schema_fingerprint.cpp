#include "import/schema_fingerprint.hpp"

namespace quire::import {

SchemaHash schema_hash(const Notetype& notetype) {
    Hasher hasher;
    for (const auto& field : notetype.fields) {
        hasher.update(field.name);
    }
    for (const auto& tmpl : notetype.templates) {
        hasher.update(tmpl.name);
    }
    return hasher.finalize();
}

} // namespace quire::import
