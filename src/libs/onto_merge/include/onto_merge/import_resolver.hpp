#pragma once

#include <onto_loaders/ontology_repository.hpp>
#include <onto_merge/prefix_allocator.hpp>
#include <onto_model/sources.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace onto_merge {

using PrefixMap = std::unordered_map<std::string, std::string>; // ontology name -> prefix

struct ImportClosure {
    // Explicit sources first (input order), then discovered imports.
    std::vector<onto_model::LoadedOntology> ontologies;
    PrefixMap prefixes;

    const std::string* prefix_of(const std::string& ontology_name) const {
        auto it = prefixes.find(ontology_name);
        return it == prefixes.end() ? nullptr : &it->second;
    }
};

// Loads every source and everything it imports, transitively, and assigns
// each ontology a unique prefix. Load failures propagate as onto_model::LoadError.
ImportClosure resolve_import_closure(const std::vector<onto_model::OntologySource>& sources,
    onto_loaders::OntologyRepository& repository,
    PrefixRegistry& registry);

} // namespace onto_merge
