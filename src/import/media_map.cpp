#include "import/media_map.hpp"

#include <algorithm>

namespace quire::import {

void MediaUseMap::add_checked(std::string referenced_name, SafeMediaEntry entry) {
    checked_.insert_or_assign(std::move(referenced_name), std::move(entry));
}

void MediaUseMap::add_unchecked(SafeMediaEntry entry) {
    unchecked_.push_back(std::move(entry));
}

const SafeMediaEntry* MediaUseMap::use_entry(const std::string& referenced_name) {
    auto it = checked_.find(referenced_name);
    if (it == checked_.end()) {
        return nullptr;
    }
    it->second.is_used = true;
    return &it->second;
}

const SafeMediaEntry* MediaUseMap::find(const std::string& referenced_name) const {
    auto it = checked_.find(referenced_name);
    return it == checked_.end() ? nullptr : &it->second;
}

std::vector<SafeMediaEntry> MediaUseMap::used_entries() const {
    std::vector<SafeMediaEntry> used;
    for (const auto& [name, entry] : checked_) {
        if (entry.is_used) {
            used.push_back(entry);
        }
    }
    std::sort(used.begin(), used.end(), [](const SafeMediaEntry& a, const SafeMediaEntry& b) {
        return a.index < b.index;
    });
    used.insert(used.end(), unchecked_.begin(), unchecked_.end());
    return used;
}

} // namespace quire::import
