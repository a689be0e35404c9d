#pragma once

#include <onto_model/ontology.hpp>
#include <optional>
#include <string>
#include <vector>

namespace onto_model {

// A user-supplied ontology reference. The location is already an IRI
// (file:// for local paths).
struct OntologySource {
    std::string location;
    std::optional<std::string> prefix;
};

struct LoadedOntology {
    const Ontology* ontology = nullptr;
    std::string name;
    std::string prefix;
};

} // namespace onto_model
