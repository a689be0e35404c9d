#pragma once

#include <onto_model/class_graph.hpp>
#include <onto_model/sources.hpp>
#include <string>
#include <vector>

namespace onto_export {

inline constexpr const char* types_set_name = "core";
inline constexpr const char* types_schema_location =
    "https://raw.githubusercontent.com/OpenCCG/openccg/master/grammars/types.xsd";

// Renders the graph as an OpenCCG types.xml document. The output only
// depends on the graph order and the ontology order.
std::string serialize_types(const onto_model::ClassGraph& graph,
    const std::vector<onto_model::LoadedOntology>& ontologies);

// Writes to the file at destination, or to stdout if destination is empty
// or "-". Throws onto_model::SerializationError on failure.
void write_document(const std::string& text, const std::string& destination);

} // namespace onto_export
