#include <cli_args/options.hpp>
#include <onto_loaders/source_spec.hpp>
#include <onto_model/errors.hpp>

namespace cli_args {

namespace {

bool matches(const std::string& arg, const char* short_name, const char* long_name) {
    return (short_name != nullptr && arg == short_name) || arg == long_name;
}

// Accepts "--name value", "-n value" and "--name=value".
std::optional<std::string> option_value(const std::vector<std::string>& args, std::size_t& i,
    const char* short_name, const char* long_name)
{
    const std::string& arg = args[i];
    const std::string long_eq = std::string(long_name) + "=";
    if (arg.compare(0, long_eq.size(), long_eq) == 0)
        return arg.substr(long_eq.size());
    if (!matches(arg, short_name, long_name))
        return std::nullopt;
    if (i + 1 >= args.size())
        throw onto_model::ConfigurationError(std::string("option ") + long_name + " expects a value");
    return args[++i];
}

} // namespace

Options parse_arguments(const std::vector<std::string>& args) {
    Options out;
    bool positional_only = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (positional_only || arg.empty() || arg[0] != '-') {
            out.ontologies.push_back(onto_loaders::parse_source_spec(arg));
            continue;
        }
        if (arg == "--") {
            positional_only = true;
        } else if (matches(arg, "-h", "--help")) {
            out.show_help = true;
        } else if (matches(arg, "-x", "--exclude-owl-thing")) {
            out.exclude_owl_thing = true;
        } else if (matches(arg, "-u", "--union-duplicates")) {
            out.union_duplicates = true;
        } else if (matches(arg, "-v", "--verbose")) {
            out.verbose = true;
        } else if (auto value = option_value(args, i, "-o", "--output")) {
            out.output = *value;
        } else if (auto value = option_value(args, i, "-l", "--lookup")) {
            out.lookup_paths.push_back(*value);
        } else if (auto value = option_value(args, i, "-c", "--config")) {
            out.config_file = *value;
        } else if (auto value = option_value(args, i, nullptr, "--log-file")) {
            out.log_file = *value;
        } else {
            throw onto_model::ConfigurationError("unknown option " + arg);
        }
    }
    if (out.ontologies.empty() && !out.show_help && !out.config_file)
        throw onto_model::ConfigurationError("at least one ontology is required");
    return out;
}

Options parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parse_arguments(args);
}

std::string usage(const std::string& program) {
    return "usage: " + program + " [options] ONTOLOGY[:PREFIX]...\n"
        "\n"
        "Converts OWL ontologies into an OpenCCG types.xml hierarchy.\n"
        "Ontologies are paths or http(s) IRIs, optionally followed by\n"
        "':prefix', e.g. ./ontologies/GUM-3.owl:gum. Without a prefix one is\n"
        "invented from the file name.\n"
        "\n"
        "options:\n"
        "  -o, --output FILE          output file (default: stdout)\n"
        "  -l, --lookup DIR           additional lookup directory for imported\n"
        "                             ontologies, may be repeated\n"
        "  -x, --exclude-owl-thing    leave out owl:Thing as the top type\n"
        "  -u, --union-duplicates     merge the parents of types defined twice\n"
        "  -c, --config FILE          read settings from a JSON project file\n"
        "  -v, --verbose              debug logging\n"
        "      --log-file FILE        also write the log to FILE\n"
        "  -h, --help                 show this help\n";
}

} // namespace cli_args
