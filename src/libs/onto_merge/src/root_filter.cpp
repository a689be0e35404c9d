#include <onto_merge/root_filter.hpp>
#include <algorithm>

namespace onto_merge {

void exclude_root(onto_model::ClassGraph& graph) {
    const std::string root = onto_model::root_type_name;
    graph.erase(root);
    for (auto& entry : graph.entries()) {
        auto& parents = entry.parents;
        parents.erase(std::remove(parents.begin(), parents.end(), root), parents.end());
    }
}

} // namespace onto_merge
