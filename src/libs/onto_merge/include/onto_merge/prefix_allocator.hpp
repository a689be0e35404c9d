#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace onto_merge {

// Short prefixes handed out during one run. A prefix, once allocated, is
// never given out again.
class PrefixRegistry {
public:
    // Returns candidate itself if unused, otherwise candidate0, candidate1, ...
    std::string allocate(const std::string& candidate);

    // allocate(derive_prefix_candidate(identifier))
    std::string derive(const std::string& identifier);

    bool contains(const std::string& prefix) const { return used_.count(prefix) != 0; }
    const std::vector<std::string>& allocated() const { return allocated_; }

private:
    std::unordered_set<std::string> used_;
    std::vector<std::string> allocated_;
};

// Invents a prefix candidate from a location or ontology name, e.g.
// "ontologies/SLM-cooking.owl" -> "sc", "GUM_space.owl" -> "gs", "UIO.owl" -> "uio".
std::string derive_prefix_candidate(const std::string& identifier);

} // namespace onto_merge
