#include "header_map.hpp"

#include <algorithm>
#include <cctype>

bool iequals(std::string_view p_lhs, std::string_view p_rhs) {
    return p_lhs.size() == p_rhs.size() &&
           std::equal(p_lhs.begin(), p_lhs.end(), p_rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

void HeaderMap::add(std::string_view p_name, std::string_view p_value) {
    entries_.emplace_back(std::string(p_name), std::string(p_value));
}

void HeaderMap::set(std::string_view p_name, std::string_view p_value) {
    erase(p_name);
    add(p_name, p_value);
}

size_t HeaderMap::erase(std::string_view p_name) {
    auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [p_name](const Entry& e) { return iequals(e.first, p_name); }),
                   entries_.end());
    return before - entries_.size();
}

bool HeaderMap::contains(std::string_view p_name) const {
    return count(p_name) > 0;
}

size_t HeaderMap::count(std::string_view p_name) const {
    return std::count_if(entries_.begin(), entries_.end(),
                         [p_name](const Entry& e) { return iequals(e.first, p_name); });
}

std::optional<std::string> HeaderMap::get(std::string_view p_name) const {
    for (const auto& [name, value] : entries_) {
        if (iequals(name, p_name)) {
            return value;
        }
    }
    return std::nullopt;
}

HeaderMap HeaderMap::merged_with(const HeaderMap& p_overrides) const {
    HeaderMap merged;
    for (const auto& entry : entries_) {
        if (!p_overrides.contains(entry.first)) {
            merged.entries_.push_back(entry);
        }
    }
    for (const auto& entry : p_overrides.entries_) {
        merged.entries_.push_back(entry);
    }
    return merged;
}
