/**
 * @file test_export_types.cpp
 * @brief End-to-end tests: command line -> merge -> types.xml
 *
 * Each case runs the ontologies in tests/data through the same steps as the
 * owl2types executable and compares the result with the matching
 * tests/data/<name>.xml. Types are compared by name, parents as sets.
 */

#include <gtest/gtest.h>
#include <cli_args/options.hpp>
#include <onto_export/types_writer.hpp>
#include <onto_loaders/config_loader.hpp>
#include <onto_loaders/iri.hpp>
#include <onto_loaders/ontology_repository.hpp>
#include <onto_merge/pipeline.hpp>
#include <onto_model/errors.hpp>
#include <tinyxml2.h>
#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>

static const std::string data_dir = OWL2TYPES_TEST_DATA_DIR;

// Type name -> sorted parents.
using TypeTable = std::map<std::string, std::vector<std::string>>;

static std::string owl(const std::string& name, const std::string& prefix = "test") {
    return data_dir + "/" + name + ".owl:" + prefix;
}

static std::string run(std::vector<std::string> args) {
    const cli_args::Options options = cli_args::parse_arguments(args);

    onto_loaders::OntologyRepository repository;
    for (const auto& path : options.lookup_paths)
        repository.add_lookup_path(path);

    onto_merge::MergeSettings settings;
    settings.exclude_owl_thing = options.exclude_owl_thing;
    settings.duplicates = options.union_duplicates ? onto_merge::DuplicatePolicy::Union
                                                   : onto_merge::DuplicatePolicy::KeepFirst;
    auto result = onto_merge::merge_ontologies(options.ontologies, repository, settings);
    return onto_export::serialize_types(result.graph, result.closure.ontologies);
}

static std::string export_types(const std::vector<std::string>& owls) {
    std::vector<std::string> args{ "--exclude-owl-thing", "--lookup", data_dir };
    args.insert(args.end(), owls.begin(), owls.end());
    return run(args);
}

static TypeTable parse_types(const std::string& text) {
    tinyxml2::XMLDocument doc;
    EXPECT_EQ(doc.Parse(text.c_str(), text.size()), tinyxml2::XML_SUCCESS) << text;
    TypeTable out;
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr) return out;
    EXPECT_STREQ(root->Name(), "types");
    for (auto* type = root->FirstChildElement("type"); type != nullptr; type = type->NextSiblingElement("type")) {
        std::vector<std::string> parents;
        if (const char* value = type->Attribute("parents")) {
            std::istringstream words(value);
            for (std::string word; words >> word;)
                parents.push_back(word);
        }
        std::sort(parents.begin(), parents.end());
        EXPECT_TRUE(out.emplace(type->Attribute("name"), parents).second) << "duplicate type " << type->Attribute("name");
    }
    return out;
}

static TypeTable expected_types(const std::string& name) {
    std::ifstream f(data_dir + "/" + name + ".xml");
    std::stringstream text;
    text << f.rdbuf();
    return parse_types(text.str());
}

static std::vector<std::string> type_order(const std::string& text) {
    tinyxml2::XMLDocument doc;
    doc.Parse(text.c_str(), text.size());
    std::vector<std::string> out;
    for (auto* type = doc.RootElement()->FirstChildElement("type"); type != nullptr; type = type->NextSiblingElement("type"))
        out.push_back(type->Attribute("name"));
    return out;
}

// ============================================================================
// Expected outputs
// ============================================================================

TEST(ExportTypesTest, Empty) {
    EXPECT_EQ(parse_types(export_types({ owl("empty") })), expected_types("empty"));
}

TEST(ExportTypesTest, SingleEntry) {
    EXPECT_EQ(parse_types(export_types({ owl("single_entry") })), expected_types("single_entry"));
}

TEST(ExportTypesTest, MultiEntry) {
    EXPECT_EQ(parse_types(export_types({ owl("multi_entry") })), expected_types("multi_entry"));
}

TEST(ExportTypesTest, SingleBranch) {
    EXPECT_EQ(parse_types(export_types({ owl("single_branch") })), expected_types("single_branch"));
}

TEST(ExportTypesTest, MultiBranch) {
    EXPECT_EQ(parse_types(export_types({ owl("multi_branch") })), expected_types("multi_branch"));
}

TEST(ExportTypesTest, MultiInheritance) {
    EXPECT_EQ(parse_types(export_types({ owl("multi_inheritance") })), expected_types("multi_inheritance"));
}

TEST(ExportTypesTest, ComplexInheritance) {
    EXPECT_EQ(parse_types(export_types({ owl("complex_inheritance") })), expected_types("complex_inheritance"));
}

TEST(ExportTypesTest, MultiOnto) {
    EXPECT_EQ(parse_types(export_types({ owl("multi_onto_A", "A"), owl("multi_onto_B", "B") })),
        expected_types("multi_onto"));
}

TEST(ExportTypesTest, SimpleImport) {
    EXPECT_EQ(parse_types(export_types({ owl("simple_import_base", "base"), owl("simple_import_ext", "ext") })),
        expected_types("simple_import"));
}

TEST(ExportTypesTest, ComplexImport) {
    EXPECT_EQ(parse_types(export_types({ owl("complex_import_a", "a"), owl("complex_import_b", "b"),
                  owl("complex_import_c", "c"), owl("complex_import_d", "d") })),
        expected_types("complex_import"));
}

// ============================================================================
// Behaviour around the expected outputs
// ============================================================================

TEST(ExportTypesTest, ExactDocument) {
    const std::string expected =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<!-- This file was generated automatically. Do not modify it manually. -->\n"
        "<!-- Ontologies used:\n"
        "    http://example.org/tests/multi_onto_A#\n"
        "    http://example.org/tests/multi_onto_B#\n"
        "-->\n"
        "<types name=\"core\" xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\""
        " xsi:noNamespaceSchemaLocation=\"https://raw.githubusercontent.com/OpenCCG/openccg/master/grammars/types.xsd\">\n"
        "    <type name=\"A-X\" />\n"
        "    <type name=\"B-Y\" parents=\"A-X\" />\n"
        "</types>\n";
    EXPECT_EQ(export_types({ owl("multi_onto_A", "A"), owl("multi_onto_B", "B") }), expected);
}

TEST(ExportTypesTest, TypesFollowOntologyOrder) {
    const std::string text = export_types({ owl("multi_onto_B", "B"), owl("multi_onto_A", "A") });
    EXPECT_EQ(type_order(text), (std::vector<std::string>{ "B-Y", "A-X" }));
}

TEST(ExportTypesTest, RepeatedRunsAreIdentical) {
    const std::vector<std::string> owls{ owl("complex_import_a", "a"), owl("complex_import_d", "d") };
    EXPECT_EQ(export_types(owls), export_types(owls));
}

TEST(ExportTypesTest, ThingKeptWithoutExclusion) {
    const TypeTable types = parse_types(run({ owl("single_branch") }));
    EXPECT_EQ(types.at("test-Food"), (std::vector<std::string>{ "owl-Thing" }));
    EXPECT_EQ(types.at("test-Vegetable"), (std::vector<std::string>{ "test-Food" }));
    EXPECT_EQ(types.count("owl-Thing"), 0u);
}

TEST(ExportTypesTest, ImportsGetDerivedPrefixes) {
    // a -> b -> d, a -> c: discovered in that order
    const std::string text = export_types({ owl("complex_import_a", "a") });
    const TypeTable types = parse_types(text);

    EXPECT_EQ(type_order(text), (std::vector<std::string>{ "a-Knife", "a-Bread", "ci-Food", "ci0-Entity", "ci1-Tool" }));
    EXPECT_EQ(types.at("a-Knife"), (std::vector<std::string>{ "ci1-Tool" }));
    EXPECT_EQ(types.at("ci-Food"), (std::vector<std::string>{ "ci0-Entity" }));
    EXPECT_EQ(types.at("ci1-Tool"), (std::vector<std::string>{ "ci0-Entity" }));
    EXPECT_TRUE(types.at("ci0-Entity").empty());
}

TEST(ExportTypesTest, ImportCycle) {
    const TypeTable types = parse_types(export_types({ owl("cycle_a", "a") }));
    ASSERT_EQ(types.size(), 2u);
    EXPECT_TRUE(types.at("a-First").empty());
    // cycle_b is only discovered through the import: "cycle_b" -> "c"
    EXPECT_EQ(types.at("c-Second"), (std::vector<std::string>{ "a-First" }));
}

TEST(ExportTypesTest, EveryParentIsAType) {
    const TypeTable types = parse_types(export_types({ owl("complex_import_a", "a") }));
    for (const auto& [name, parents] : types) {
        for (const auto& parent : parents)
            EXPECT_EQ(types.count(parent), 1u) << name << " -> " << parent;
    }
}

TEST(ExportTypesTest, UrlSources) {
    // Both URLs resolve through the lookup directory before any download.
    EXPECT_EQ(parse_types(export_types({ "http://example.org/tests/multi_onto_A.owl:A",
                  "http://example.org/tests/multi_onto_B.owl:B" })),
        expected_types("multi_onto"));
}

TEST(ExportTypesTest, ProjectFile) {
    auto config = onto_loaders::load_project_config_file(data_dir + "/project.json");
    ASSERT_TRUE(config.has_value());

    onto_loaders::OntologyRepository repository;
    for (const auto& path : config->lookup_paths)
        repository.add_lookup_path(path);
    onto_merge::MergeSettings settings;
    settings.exclude_owl_thing = config->exclude_owl_thing.value_or(false);
    auto result = onto_merge::merge_ontologies(config->ontologies, repository, settings);

    EXPECT_EQ(parse_types(onto_export::serialize_types(result.graph, result.closure.ontologies)),
        expected_types("multi_onto"));
}

// ============================================================================
// Failures
// ============================================================================

TEST(ExportTypesTest, MissingImportFails) {
    EXPECT_THROW(export_types({ owl("missing_import") }), onto_model::LoadError);
}

TEST(ExportTypesTest, MalformedOntologyFails) {
    EXPECT_THROW(export_types({ owl("broken") }), onto_model::LoadError);
}

TEST(ExportTypesTest, MissingFileFails) {
    EXPECT_THROW(export_types({ owl("does_not_exist") }), onto_model::LoadError);
}
