#pragma once

#include <onto_loaders/document_fetcher.hpp>
#include <onto_model/ontology.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace onto_loaders {

// Owns every ontology loaded during one run and answers the questions the
// merge pipeline asks about them. Loading an ontology loads its imports.
class OntologyRepository {
public:
    OntologyRepository();

    OntologyRepository(const OntologyRepository&) = delete;
    OntologyRepository& operator=(const OntologyRepository&) = delete;

    // Directories searched for imported ontologies that are not file IRIs.
    void add_lookup_path(const std::string& directory);
    const std::vector<std::string>& lookup_paths() const { return lookup_paths_; }

    // In-memory documents, consulted before any file lookup.
    void register_document(const std::string& iri, std::string text);

    // Used for http(s) locations that no lookup directory provides.
    // Without a fetcher such locations fail to load.
    void set_fetcher(std::unique_ptr<DocumentFetcher> fetcher) { fetcher_ = std::move(fetcher); }

    // Throws onto_model::LoadError if the location (or one of its imports)
    // cannot be resolved, read or parsed.
    const onto_model::Ontology& load(const std::string& location);

    // Pre-order walk over the import graph, starting with the ontology itself.
    std::vector<const onto_model::Ontology*> transitively_imported(const onto_model::Ontology& ontology) const;

    // Superclass axioms for a class gathered over all loaded ontologies, in
    // load order. owl:Thing is prepended when none of them is a named class.
    std::vector<onto_model::ClassExpression> direct_superclasses(const std::string& class_iri) const;

    // The ontology a class belongs to: the one whose base IRI is the class's
    // namespace, else the first declaring it, else the referencing ontology.
    const onto_model::Ontology& owner_of(const std::string& class_iri, const onto_model::Ontology& referencing) const;

    std::string local_name(const std::string& class_iri) const;

    const onto_model::Ontology& owl_vocabulary() const { return owl_; }
    std::size_t size() const { return ontologies_.size(); }

private:
    const onto_model::Ontology& load_from(const std::string& location, const std::string& importer);
    const onto_model::Ontology* find_loaded(const std::string& iri) const;
    std::string read_document(const std::string& location, const std::string& importer) const;
    void remember(const std::string& iri, const onto_model::Ontology* ontology);

    std::vector<std::string> lookup_paths_;
    std::unordered_map<std::string, std::string> catalog_;
    std::unique_ptr<DocumentFetcher> fetcher_;
    std::vector<std::unique_ptr<onto_model::Ontology>> ontologies_;
    std::unordered_map<std::string, const onto_model::Ontology*> by_iri_;
    std::unordered_map<std::string, const onto_model::Ontology*> declared_by_;
    std::unordered_map<const onto_model::Ontology*, std::vector<const onto_model::Ontology*>> imports_;
    onto_model::Ontology owl_;
};

} // namespace onto_loaders
