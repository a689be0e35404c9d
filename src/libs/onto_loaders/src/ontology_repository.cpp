#include <onto_loaders/ontology_repository.hpp>
#include <onto_loaders/iri.hpp>
#include <onto_loaders/rdf_xml_parser.hpp>
#include <onto_model/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace onto_loaders {

namespace {

const char* const document_extensions[] = { "", ".owl", ".rdf", ".xml" };
const std::string owl_thing = std::string(onto_model::owl_namespace) + "Thing";

// "http://a.org/onto#" and "http://a.org/onto" name the same ontology.
std::string iri_key(const std::string& iri) {
    std::string key = iri;
    while (!key.empty() && (key.back() == '#' || key.back() == '/'))
        key.pop_back();
    return key;
}

bool is_remote(const std::string& iri) {
    return iri.compare(0, 7, "http://") == 0 || iri.compare(0, 8, "https://") == 0;
}

} // namespace

OntologyRepository::OntologyRepository() {
    owl_.location = onto_model::owl_namespace;
    owl_.ontology_iri = iri_key(onto_model::owl_namespace);
    owl_.base_iri = onto_model::owl_namespace;
    owl_.name = onto_model::owl_ontology_name;
    by_iri_.emplace(iri_key(owl_.base_iri), &owl_);
}

void OntologyRepository::add_lookup_path(const std::string& directory) {
    lookup_paths_.push_back(directory);
}

void OntologyRepository::register_document(const std::string& iri, std::string text) {
    catalog_[iri_key(iri)] = std::move(text);
}

const onto_model::Ontology& OntologyRepository::load(const std::string& location) {
    return load_from(location, {});
}

const onto_model::Ontology& OntologyRepository::load_from(const std::string& location, const std::string& importer) {
    if (const auto* known = find_loaded(location)) return *known;

    auto ontology = std::make_unique<onto_model::Ontology>(parse_rdf_xml(read_document(location, importer), location));
    if (!ontology->ontology_iri.empty()) {
        if (const auto* known = find_loaded(ontology->ontology_iri)) {
            spdlog::debug("{} declares {}, which is already loaded", location, ontology->ontology_iri);
            remember(location, known);
            return *known;
        }
    }

    const onto_model::Ontology* loaded = ontology.get();
    ontologies_.push_back(std::move(ontology));
    remember(location, loaded);
    remember(loaded->base_iri, loaded);
    if (!loaded->ontology_iri.empty()) remember(loaded->ontology_iri, loaded);
    for (const auto& class_iri : loaded->classes)
        declared_by_.emplace(class_iri, loaded);
    spdlog::info("Loaded ontology '{}' from {}", loaded->name, location);

    std::vector<const onto_model::Ontology*> imported;
    for (const auto& import : loaded->imports)
        imported.push_back(&load_from(import, location));
    imports_[loaded] = std::move(imported);
    return *loaded;
}

const onto_model::Ontology* OntologyRepository::find_loaded(const std::string& iri) const {
    auto it = by_iri_.find(iri_key(iri));
    return it == by_iri_.end() ? nullptr : it->second;
}

void OntologyRepository::remember(const std::string& iri, const onto_model::Ontology* ontology) {
    by_iri_.emplace(iri_key(iri), ontology);
}

std::string OntologyRepository::read_document(const std::string& location, const std::string& importer) const {
    auto cached = catalog_.find(iri_key(location));
    if (cached != catalog_.end()) return cached->second;

    std::filesystem::path path;
    if (is_file_uri(location)) {
        path = path_from_file_uri(location);
    } else {
        const std::string name = last_segment(location);
        std::vector<std::filesystem::path> directories(lookup_paths_.begin(), lookup_paths_.end());
        if (is_file_uri(importer))
            directories.push_back(std::filesystem::path(path_from_file_uri(importer)).parent_path());

        std::error_code ec;
        for (const auto& directory : directories) {
            for (const char* extension : document_extensions) {
                const auto candidate = directory / (name + extension);
                if (!name.empty() && std::filesystem::is_regular_file(candidate, ec)) {
                    path = candidate;
                    break;
                }
            }
            if (!path.empty()) break;
        }
        if (path.empty()) {
            if (fetcher_ && is_remote(location)) return fetcher_->fetch(location);
            throw onto_model::LoadError(location, "cannot resolve ontology, not found in any lookup path");
        }
        spdlog::debug("Resolved {} to {}", location, path.string());
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) throw onto_model::LoadError(location, "cannot read " + path.string());
    std::ostringstream text;
    text << f.rdbuf();
    return text.str();
}

std::vector<const onto_model::Ontology*> OntologyRepository::transitively_imported(
    const onto_model::Ontology& ontology) const
{
    std::vector<const onto_model::Ontology*> out;
    std::unordered_set<const onto_model::Ontology*> seen;
    std::vector<const onto_model::Ontology*> stack{ &ontology };
    while (!stack.empty()) {
        const onto_model::Ontology* current = stack.back();
        stack.pop_back();
        if (!seen.insert(current).second) continue;
        out.push_back(current);
        auto it = imports_.find(current);
        if (it == imports_.end()) continue;
        for (auto child = it->second.rbegin(); child != it->second.rend(); ++child)
            stack.push_back(*child);
    }
    return out;
}

std::vector<onto_model::ClassExpression> OntologyRepository::direct_superclasses(const std::string& class_iri) const {
    std::vector<onto_model::ClassExpression> out;
    for (const auto& ontology : ontologies_) {
        auto it = ontology->superclasses.find(class_iri);
        if (it != ontology->superclasses.end())
            out.insert(out.end(), it->second.begin(), it->second.end());
    }
    // Every class without a named superclass is a direct subclass of owl:Thing.
    const bool has_named = std::any_of(out.begin(), out.end(),
        [](const onto_model::ClassExpression& e) { return e.is_named_class(); });
    if (!has_named && class_iri != owl_thing)
        out.insert(out.begin(), onto_model::ClassExpression{ onto_model::ClassExpression::Kind::NamedClass, owl_thing });
    return out;
}

const onto_model::Ontology& OntologyRepository::owner_of(const std::string& class_iri,
    const onto_model::Ontology& referencing) const
{
    const std::string ns = namespace_of(class_iri);
    if (ns == owl_.base_iri) return owl_;
    auto by_namespace = std::find_if(ontologies_.begin(), ontologies_.end(),
        [&](const auto& ontology) { return ontology->base_iri == ns; });
    if (by_namespace != ontologies_.end()) return **by_namespace;
    auto declared = declared_by_.find(class_iri);
    if (declared != declared_by_.end()) return *declared->second;
    return referencing;
}

std::string OntologyRepository::local_name(const std::string& class_iri) const {
    return local_name_of(class_iri);
}

} // namespace onto_loaders
