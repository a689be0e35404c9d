#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace onto_model {

inline constexpr const char* owl_namespace = "http://www.w3.org/2002/07/owl#";
inline constexpr const char* owl_ontology_name = "owl";

// What appears on the right-hand side of an rdfs:subClassOf.
// Only NamedClass entries are types; the rest are anonymous expressions.
struct ClassExpression {
    enum class Kind { NamedClass, Restriction, Anonymous };
    Kind kind = Kind::NamedClass;
    std::string iri; // empty unless kind == NamedClass

    bool is_named_class() const { return kind == Kind::NamedClass && !iri.empty(); }
};

struct Ontology {
    std::string location;     // IRI the document was read from
    std::string ontology_iri; // declared owl:Ontology IRI, may be empty
    std::string base_iri;     // always ends in '#' or '/'
    std::string name;         // canonical name, see canonical_name()
    std::vector<std::string> imports;
    // Classes declared in this document, in document order, without duplicates.
    std::vector<std::string> classes;
    std::unordered_map<std::string, std::vector<ClassExpression>> superclasses;
};

// Derives an ontology's canonical name from its base IRI:
// "http://example.org/pizza.owl#" -> "pizza".
inline std::string canonical_name(const std::string& base_iri) {
    if (base_iri.empty()) return {};
    std::string trimmed = base_iri.substr(0, base_iri.size() - 1);
    const auto slash = trimmed.rfind('/');
    std::string name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    auto ends_with = [&](const char* suffix) {
        const std::string s(suffix);
        return name.size() >= s.size() && name.compare(name.size() - s.size(), s.size(), s) == 0;
    };
    if (ends_with(".owl") || ends_with(".rdf"))
        name.resize(name.size() - 4);
    return name;
}

} // namespace onto_model
