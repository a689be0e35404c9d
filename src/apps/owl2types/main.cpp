// owl2types: OWL ontologies -> OpenCCG types.xml (C++20)
#include <cli_args/options.hpp>
#include <onto_export/types_writer.hpp>
#include <onto_loaders/config_loader.hpp>
#include <onto_loaders/ontology_repository.hpp>
#include <onto_merge/pipeline.hpp>
#include <onto_model/errors.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

const int exit_failure = 1;
const int exit_usage = 2;

// Output goes to stdout, so the log always goes to stderr.
void setup_logging(const cli_args::Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    std::string file_error;
    if (options.log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.log_file, true));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }
    auto logger = std::make_shared<spdlog::logger>("owl2types", sinks.begin(), sinks.end());
    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_default_logger(logger);
    if (!file_error.empty())
        logger->warn("Cannot open log file {}: {}", *options.log_file, file_error);
}

struct RunSettings {
    std::vector<onto_model::OntologySource> sources;
    std::vector<std::string> lookup_paths;
    std::string output;
    onto_merge::MergeSettings merge;
};

// Project file entries come first; command-line values win for scalars.
RunSettings collect_settings(const cli_args::Options& options) {
    RunSettings out;
    out.output = options.output;
    out.merge.exclude_owl_thing = options.exclude_owl_thing;
    bool union_duplicates = options.union_duplicates;

    if (options.config_file) {
        auto config = onto_loaders::load_project_config_file(*options.config_file);
        if (!config)
            throw onto_model::ConfigurationError("cannot read project file " + *options.config_file);
        out.sources = std::move(config->ontologies);
        out.lookup_paths = std::move(config->lookup_paths);
        if (out.output.empty() && config->output) out.output = *config->output;
        out.merge.exclude_owl_thing = out.merge.exclude_owl_thing || config->exclude_owl_thing.value_or(false);
        union_duplicates = union_duplicates || config->union_duplicates.value_or(false);
    }
    out.sources.insert(out.sources.end(), options.ontologies.begin(), options.ontologies.end());
    out.lookup_paths.insert(out.lookup_paths.end(), options.lookup_paths.begin(), options.lookup_paths.end());
    out.merge.duplicates = union_duplicates ? onto_merge::DuplicatePolicy::Union : onto_merge::DuplicatePolicy::KeepFirst;

    if (out.sources.empty())
        throw onto_model::ConfigurationError("at least one ontology is required");
    return out;
}

void run(const RunSettings& settings) {
    onto_loaders::OntologyRepository repository;
    for (const auto& path : settings.lookup_paths)
        repository.add_lookup_path(path);
    repository.set_fetcher(std::make_unique<onto_loaders::CurlFetcher>());

    const auto result = onto_merge::merge_ontologies(settings.sources, repository, settings.merge);
    const std::string document = onto_export::serialize_types(result.graph, result.closure.ontologies);
    onto_export::write_document(document, settings.output);
}

} // namespace

int main(int argc, char* argv[])
{
    const std::string program = argc > 0 ? argv[0] : "owl2types";

    cli_args::Options options;
    try {
        options = cli_args::parse_arguments(argc, argv);
    } catch (const onto_model::ConfigurationError& e) {
        std::cerr << program << ": error: " << e.what() << "\n\n" << cli_args::usage(program);
        return exit_usage;
    }
    if (options.show_help) {
        std::cout << cli_args::usage(program);
        return 0;
    }
    setup_logging(options);

    try {
        run(collect_settings(options));
    } catch (const onto_model::ConfigurationError& e) {
        spdlog::error("{}", e.what());
        return exit_usage;
    } catch (const onto_model::LoadError& e) {
        spdlog::error("Cannot load ontology: {}", e.what());
        return exit_failure;
    } catch (const onto_model::SerializationError& e) {
        spdlog::error("Cannot write output: {}", e.what());
        return exit_failure;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return exit_failure;
    }
    return 0;
}
