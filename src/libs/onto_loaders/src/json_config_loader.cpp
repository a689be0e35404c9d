#include <onto_loaders/config_loader.hpp>
#include <onto_loaders/source_spec.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace onto_loaders {

namespace {

std::string anchored(const std::string& path, const std::string& base_directory) {
    if (path.empty() || base_directory.empty() || path.compare(0, 4, "http") == 0) return path;
    const std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(base_directory) / p).lexically_normal().string();
}

std::optional<onto_model::OntologySource> parse_ontology(const nlohmann::json& o, const std::string& base_directory) {
    if (o.is_string()) {
        // Same "location[:prefix]" form as the command line.
        auto [location, prefix] = split_source_spec(o.get<std::string>());
        return make_source(anchored(location, base_directory), std::move(prefix));
    }
    if (!o.is_object() || !o.contains("location") || !o["location"].is_string()) return std::nullopt;
    std::optional<std::string> prefix;
    if (o.contains("prefix") && o["prefix"].is_string()) prefix = o["prefix"].get<std::string>();
    return make_source(anchored(o["location"].get<std::string>(), base_directory), prefix);
}

std::optional<ProjectConfig> parse_project_json(const nlohmann::json& j, const std::string& base_directory) {
    ProjectConfig out;
    if (!j.is_object()) return std::nullopt;
    if (j.contains("ontologies")) {
        if (!j["ontologies"].is_array()) return std::nullopt;
        for (const auto& o : j["ontologies"]) {
            auto source = parse_ontology(o, base_directory);
            if (!source) return std::nullopt;
            out.ontologies.push_back(std::move(*source));
        }
    }
    if (j.contains("lookup") && j["lookup"].is_array()) {
        for (const auto& l : j["lookup"])
            if (l.is_string()) out.lookup_paths.push_back(anchored(l.get<std::string>(), base_directory));
    }
    if (j.contains("output") && j["output"].is_string())
        out.output = anchored(j["output"].get<std::string>(), base_directory);
    if (j.contains("exclude_owl_thing") && j["exclude_owl_thing"].is_boolean())
        out.exclude_owl_thing = j["exclude_owl_thing"].get<bool>();
    if (j.contains("union_duplicates") && j["union_duplicates"].is_boolean())
        out.union_duplicates = j["union_duplicates"].get<bool>();
    return out;
}

} // namespace

std::optional<ProjectConfig> load_project_config(std::istream& in, const std::string& base_directory) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_project_json(j, base_directory);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid project file: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ProjectConfig> load_project_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_project_config(f, std::filesystem::path(path).parent_path().string());
}

} // namespace onto_loaders
