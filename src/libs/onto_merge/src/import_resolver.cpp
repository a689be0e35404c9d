#include <onto_merge/import_resolver.hpp>
#include <spdlog/spdlog.h>

namespace onto_merge {

ImportClosure resolve_import_closure(const std::vector<onto_model::OntologySource>& sources,
    onto_loaders::OntologyRepository& repository,
    PrefixRegistry& registry)
{
    ImportClosure out;
    out.prefixes[onto_model::owl_ontology_name] = onto_model::owl_ontology_name;

    for (const auto& source : sources) {
        const onto_model::Ontology& ontology = repository.load(source.location);
        const std::string prefix = source.prefix ? registry.allocate(*source.prefix) : registry.derive(source.location);
        auto previous = out.prefixes.find(ontology.name);
        if (previous != out.prefixes.end() && ontology.name != onto_model::owl_ontology_name)
            spdlog::warn("Ontology name '{}' is used twice, prefix '{}' replaces '{}'",
                ontology.name, prefix, previous->second);
        out.prefixes[ontology.name] = prefix;
        out.ontologies.push_back({ &ontology, ontology.name, prefix });
        spdlog::debug("Ontology '{}' ({}) gets prefix '{}'", ontology.name, source.location, prefix);
    }

    // The list grows while it is walked, so imports of discovered
    // ontologies are visited as well.
    for (std::size_t i = 0; i < out.ontologies.size(); ++i) {
        const onto_model::Ontology* current = out.ontologies[i].ontology;
        for (const onto_model::Ontology* imported : repository.transitively_imported(*current)) {
            if (out.prefixes.count(imported->name)) continue;
            const std::string prefix = registry.derive(imported->name);
            out.prefixes[imported->name] = prefix;
            out.ontologies.push_back({ imported, imported->name, prefix });
            spdlog::debug("Imported ontology '{}' gets prefix '{}'", imported->name, prefix);
        }
    }
    return out;
}

} // namespace onto_merge
