#include <onto_merge/class_extractor.hpp>
#include <onto_model/errors.hpp>
#include <spdlog/spdlog.h>

namespace onto_merge {

namespace {

std::string class_name(const std::string& class_iri, const onto_model::Ontology& context,
    const ImportClosure& closure, const onto_loaders::OntologyRepository& repository)
{
    const onto_model::Ontology& owner = repository.owner_of(class_iri, context);
    const std::string* prefix = closure.prefix_of(owner.name);
    if (prefix == nullptr)
        throw onto_model::LoadError(owner.location, "no prefix assigned to ontology '" + owner.name + "'");
    return onto_model::qualified_name(*prefix, repository.local_name(class_iri));
}

} // namespace

onto_model::ClassGraph extract_classes(const ImportClosure& closure,
    const onto_loaders::OntologyRepository& repository,
    DuplicatePolicy policy)
{
    onto_model::ClassGraph graph;
    for (const auto& loaded : closure.ontologies) {
        const onto_model::Ontology& ontology = *loaded.ontology;
        for (const auto& class_iri : ontology.classes) {
            onto_model::TypeEntry entry;
            entry.name = class_name(class_iri, ontology, closure, repository);
            for (const auto& parent : repository.direct_superclasses(class_iri)) {
                if (!parent.is_named_class()) continue;
                entry.add_parent(class_name(parent.iri, ontology, closure, repository));
            }

            onto_model::TypeEntry* existing = graph.find(entry.name);
            if (existing == nullptr) {
                graph.insert(std::move(entry));
                continue;
            }
            if (policy == DuplicatePolicy::Union) {
                for (const auto& parent : entry.parents)
                    existing->add_parent(parent);
            } else if (existing->parents != entry.parents) {
                spdlog::debug("Type '{}' from '{}' already defined, its parents are ignored",
                    entry.name, ontology.name);
            }
        }
    }
    return graph;
}

} // namespace onto_merge
