#pragma once

#include <onto_loaders/ontology_repository.hpp>
#include <onto_merge/import_resolver.hpp>
#include <onto_model/class_graph.hpp>

namespace onto_merge {

// What to do when two classes map to the same qualified name.
enum class DuplicatePolicy {
    KeepFirst, // first parent set wins, later ones are dropped
    Union      // later parents are appended to the first entry
};

// Builds the merged hierarchy: one entry per class declared in any
// ontology of the closure, with its named direct superclasses as parents.
// Throws onto_model::LoadError if a class belongs to an ontology that has
// no prefix.
onto_model::ClassGraph extract_classes(const ImportClosure& closure,
    const onto_loaders::OntologyRepository& repository,
    DuplicatePolicy policy = DuplicatePolicy::KeepFirst);

} // namespace onto_merge
