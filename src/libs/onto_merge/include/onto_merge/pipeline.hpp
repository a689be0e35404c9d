#pragma once

#include <onto_loaders/ontology_repository.hpp>
#include <onto_merge/class_extractor.hpp>
#include <onto_merge/import_resolver.hpp>
#include <onto_model/class_graph.hpp>
#include <onto_model/sources.hpp>
#include <vector>

namespace onto_merge {

struct MergeSettings {
    bool exclude_owl_thing = false;
    DuplicatePolicy duplicates = DuplicatePolicy::KeepFirst;
};

struct MergeResult {
    ImportClosure closure;
    onto_model::ClassGraph graph;
};

// Resolve -> extract -> (exclude root). The result points into the
// repository, which must outlive it.
MergeResult merge_ontologies(const std::vector<onto_model::OntologySource>& sources,
    onto_loaders::OntologyRepository& repository,
    const MergeSettings& settings = {});

} // namespace onto_merge
