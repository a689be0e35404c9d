#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace onto_model {

inline constexpr const char* root_type_name = "owl-Thing";

inline std::string qualified_name(const std::string& prefix, const std::string& local_name) {
    return prefix + "-" + local_name;
}

struct TypeEntry {
    std::string name;
    // Direct parents only, in first-seen order, without duplicates.
    std::vector<std::string> parents;

    bool has_parent(const std::string& parent) const {
        return std::find(parents.begin(), parents.end(), parent) != parents.end();
    }
    void add_parent(const std::string& parent) {
        if (!has_parent(parent)) parents.push_back(parent);
    }
};

// Qualified type name -> direct parents, iterated in insertion order.
class ClassGraph {
public:
    using const_iterator = std::vector<TypeEntry>::const_iterator;

    // Returns false (and leaves the graph untouched) if the name exists.
    bool insert(TypeEntry entry) {
        if (index_.count(entry.name)) return false;
        index_.emplace(entry.name, entries_.size());
        entries_.push_back(std::move(entry));
        return true;
    }

    TypeEntry* find(const std::string& name) {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &entries_[it->second];
    }
    const TypeEntry* find(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &entries_[it->second];
    }
    bool contains(const std::string& name) const { return index_.count(name) != 0; }

    bool erase(const std::string& name) {
        auto it = index_.find(name);
        if (it == index_.end()) return false;
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
        rebuild_index();
        return true;
    }

    std::vector<TypeEntry>& entries() { return entries_; }
    const std::vector<TypeEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    void rebuild_index() {
        index_.clear();
        for (std::size_t i = 0; i < entries_.size(); ++i)
            index_.emplace(entries_[i].name, i);
    }

    std::vector<TypeEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace onto_model
