#pragma once

#include <onto_model/class_graph.hpp>

namespace onto_merge {

// Removes owl-Thing from the graph, both as a type and as a parent.
// The graph is modified in place.
void exclude_root(onto_model::ClassGraph& graph);

} // namespace onto_merge
