#include <onto_merge/pipeline.hpp>
#include <onto_merge/prefix_allocator.hpp>
#include <onto_merge/root_filter.hpp>
#include <spdlog/spdlog.h>

namespace onto_merge {

MergeResult merge_ontologies(const std::vector<onto_model::OntologySource>& sources,
    onto_loaders::OntologyRepository& repository,
    const MergeSettings& settings)
{
    PrefixRegistry registry;
    MergeResult out;
    out.closure = resolve_import_closure(sources, repository, registry);
    out.graph = extract_classes(out.closure, repository, settings.duplicates);
    if (settings.exclude_owl_thing)
        exclude_root(out.graph);
    spdlog::info("Merged {} ontologies into {} types", out.closure.ontologies.size(), out.graph.size());
    return out;
}

} // namespace onto_merge
