#pragma once

#include <onto_model/ontology.hpp>
#include <string>

namespace onto_loaders {

// Parses an OWL ontology serialized as RDF/XML. Only the parts that
// make up the class hierarchy are read: the ontology header with its
// imports, class declarations and rdfs:subClassOf axioms.
// Throws onto_model::LoadError if the text is not well-formed XML.
onto_model::Ontology parse_rdf_xml(const std::string& text, const std::string& location);

} // namespace onto_loaders
