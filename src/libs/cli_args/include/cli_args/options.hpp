#pragma once

#include <onto_model/sources.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cli_args {

struct Options {
    std::vector<onto_model::OntologySource> ontologies;
    std::vector<std::string> lookup_paths;
    std::string output; // empty: stdout
    bool exclude_owl_thing = false;
    bool union_duplicates = false;
    std::optional<std::string> config_file;
    bool verbose = false;
    std::optional<std::string> log_file;
    bool show_help = false;
};

// Throws onto_model::ConfigurationError on unknown options, missing option
// values or when no ontology is given (unless --help or --config is present).
Options parse_arguments(const std::vector<std::string>& args);
Options parse_arguments(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace cli_args
