#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

bool iequals(std::string_view p_lhs, std::string_view p_rhs);

// Header multimap: case-insensitive names, insertion order preserved.
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<Entry> p_entries) : entries_(p_entries) {}

    void add(std::string_view p_name, std::string_view p_value);
    // Drops every existing occurrence, then appends
    void set(std::string_view p_name, std::string_view p_value);
    size_t erase(std::string_view p_name);

    bool contains(std::string_view p_name) const;
    size_t count(std::string_view p_name) const;
    std::optional<std::string> get(std::string_view p_name) const;

    // Copy of this map with every header of p_overrides replacing the
    // same-named headers here, appended in p_overrides order.
    HeaderMap merged_with(const HeaderMap& p_overrides) const;

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const HeaderMap& p_other) const { return entries_ == p_other.entries_; }
    bool operator!=(const HeaderMap& p_other) const { return !(*this == p_other); }

private:
    std::vector<Entry> entries_;
};
