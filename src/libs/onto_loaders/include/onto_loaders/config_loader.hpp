#pragma once

#include <onto_model/sources.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace onto_loaders {

// Project file equivalent of the command line. Unset optionals defer to
// the command line or the built-in defaults.
struct ProjectConfig {
    std::vector<onto_model::OntologySource> ontologies;
    std::vector<std::string> lookup_paths;
    std::optional<std::string> output;
    std::optional<bool> exclude_owl_thing;
    std::optional<bool> union_duplicates;
};

// Relative ontology locations, lookup paths and the output path are
// resolved against base_directory.
std::optional<ProjectConfig> load_project_config(std::istream& in, const std::string& base_directory);
std::optional<ProjectConfig> load_project_config_file(const std::string& path);

} // namespace onto_loaders
