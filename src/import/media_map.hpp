#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quire::import {

/**
 * SafeMediaEntry - one media file of an incoming package.
 *
 * `name` is the (safe, normalized) file name the file will have in the
 * target collection; `index` locates the file inside the package.
 */
struct SafeMediaEntry {
    std::string name;
    std::size_t index{0};
    bool is_used{false};

    bool operator==(const SafeMediaEntry&) const = default;
};

/**
 * MediaUseMap - media files of a package, keyed by the normalized name the
 * notes reference them by.
 *
 * Checked entries are resolved by reference; unchecked entries are files
 * that are copied regardless of references. Resolving a reference marks its
 * entry as used, so that only referenced files get copied later.
 */
class MediaUseMap {
public:
    void add_checked(std::string referenced_name, SafeMediaEntry entry);

    void add_unchecked(SafeMediaEntry entry);

    /**
     * Look up the entry for a normalized reference and mark it used.
     * Returns nullptr if there is none.
     */
    const SafeMediaEntry* use_entry(const std::string& referenced_name);

    [[nodiscard]] const SafeMediaEntry* find(const std::string& referenced_name) const;

    /**
     * Entries that must be copied: used checked entries (ordered by index)
     * followed by all unchecked entries.
     */
    [[nodiscard]] std::vector<SafeMediaEntry> used_entries() const;

    [[nodiscard]] std::size_t size() const { return checked_.size() + unchecked_.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    std::unordered_map<std::string, SafeMediaEntry> checked_;
    std::vector<SafeMediaEntry> unchecked_;
};

} // namespace quire::import
