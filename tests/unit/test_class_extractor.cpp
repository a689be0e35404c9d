/**
 * @file test_class_extractor.cpp
 * @brief Unit tests for building the merged class graph
 */

#include <gtest/gtest.h>
#include <onto_merge/class_extractor.hpp>
#include <onto_merge/pipeline.hpp>
#include <onto_model/errors.hpp>

using onto_loaders::OntologyRepository;
using onto_merge::DuplicatePolicy;
using onto_merge::PrefixRegistry;

static std::string ontology_document(const std::string& name, const std::string& body) {
    return
        "<rdf:RDF xmlns=\"http://example.org/" + name + "#\"\n"
        "     xml:base=\"http://example.org/" + name + "\"\n"
        "     xmlns:owl=\"http://www.w3.org/2002/07/owl#\"\n"
        "     xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\"\n"
        "     xmlns:rdfs=\"http://www.w3.org/2000/01/rdf-schema#\">\n"
        "  <owl:Ontology rdf:about=\"http://example.org/" + name + "\"/>\n" +
        body + "</rdf:RDF>\n";
}

static std::vector<std::string> type_names(const onto_model::ClassGraph& graph) {
    std::vector<std::string> out;
    for (const auto& entry : graph)
        out.push_back(entry.name);
    return out;
}

static std::vector<std::string> parents_of(const onto_model::ClassGraph& graph, const std::string& name) {
    const auto* entry = graph.find(name);
    return entry ? entry->parents : std::vector<std::string>{ "<missing>" };
}

class ClassExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository.register_document("http://example.org/food", ontology_document("food",
            "<owl:Class rdf:about=\"#Food\"/>\n"
            "<owl:Class rdf:about=\"#Bread\">\n"
            "  <rdfs:subClassOf rdf:resource=\"#Food\"/>\n"
            "  <rdfs:subClassOf><owl:Restriction/></rdfs:subClassOf>\n"
            "</owl:Class>\n"));
        repository.register_document("http://example.org/meals", ontology_document("meals",
            "<owl:Class rdf:about=\"#Sandwich\">\n"
            "  <rdfs:subClassOf rdf:resource=\"http://example.org/food#Bread\"/>\n"
            "  <rdfs:subClassOf rdf:resource=\"#Meal\"/>\n"
            "</owl:Class>\n"
            "<owl:Class rdf:about=\"#Meal\"/>\n"));
        // Two IRIs with the same local name in the same ontology.
        repository.register_document("http://example.org/dupes", ontology_document("dupes",
            "<owl:Class rdf:about=\"#A\"/>\n"
            "<owl:Class rdf:about=\"#B\"/>\n"
            "<owl:Class rdf:about=\"#Item\"><rdfs:subClassOf rdf:resource=\"#A\"/></owl:Class>\n"
            "<owl:Class rdf:about=\"http://example.org/dupes/Item\"><rdfs:subClassOf rdf:resource=\"#B\"/></owl:Class>\n"));
    }

    onto_model::ClassGraph extract(const std::vector<onto_model::OntologySource>& sources,
        DuplicatePolicy policy = DuplicatePolicy::KeepFirst)
    {
        const auto closure = onto_merge::resolve_import_closure(sources, repository, registry);
        return onto_merge::extract_classes(closure, repository, policy);
    }

    OntologyRepository repository;
    PrefixRegistry registry;
};

TEST_F(ClassExtractorTest, QualifiedNamesAndParents) {
    auto graph = extract({ { "http://example.org/food", "f" }, { "http://example.org/meals", "m" } });

    EXPECT_EQ(type_names(graph), (std::vector<std::string>{ "f-Food", "f-Bread", "m-Sandwich", "m-Meal" }));
    EXPECT_EQ(parents_of(graph, "f-Bread"), (std::vector<std::string>{ "f-Food" }));
    EXPECT_EQ(parents_of(graph, "m-Sandwich"), (std::vector<std::string>{ "f-Bread", "m-Meal" }));
}

TEST_F(ClassExtractorTest, RootClassesHaveThingAsParent) {
    auto graph = extract({ { "http://example.org/food", "f" } });

    EXPECT_EQ(parents_of(graph, "f-Food"), (std::vector<std::string>{ "owl-Thing" }));
    EXPECT_FALSE(graph.contains("owl-Thing"));
}

TEST_F(ClassExtractorTest, ParentsAreNamedTypes) {
    auto graph = extract({ { "http://example.org/food", "f" }, { "http://example.org/meals", "m" } });

    for (const auto& entry : graph) {
        for (const auto& parent : entry.parents)
            EXPECT_NE(parent.find('-'), std::string::npos) << entry.name << " has parent " << parent;
    }
}

TEST_F(ClassExtractorTest, OwnerWithoutPrefixThrows) {
    repository.load("http://example.org/food");
    EXPECT_THROW(extract({ { "http://example.org/meals", "m" } }), onto_model::LoadError);
}

TEST_F(ClassExtractorTest, DuplicateKeepsFirstParents) {
    auto graph = extract({ { "http://example.org/dupes", "d" } });

    EXPECT_EQ(type_names(graph), (std::vector<std::string>{ "d-A", "d-B", "d-Item" }));
    EXPECT_EQ(parents_of(graph, "d-Item"), (std::vector<std::string>{ "d-A" }));
}

TEST_F(ClassExtractorTest, DuplicateUnionMergesParents) {
    auto graph = extract({ { "http://example.org/dupes", "d" } }, DuplicatePolicy::Union);

    EXPECT_EQ(type_names(graph), (std::vector<std::string>{ "d-A", "d-B", "d-Item" }));
    EXPECT_EQ(parents_of(graph, "d-Item"), (std::vector<std::string>{ "d-A", "d-B" }));
}

TEST_F(ClassExtractorTest, OrderFollowsClosure) {
    auto graph = extract({ { "http://example.org/meals", "m" }, { "http://example.org/food", "f" } });
    EXPECT_EQ(type_names(graph), (std::vector<std::string>{ "m-Sandwich", "m-Meal", "f-Food", "f-Bread" }));
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_F(ClassExtractorTest, MergeWithoutRootFilter) {
    auto result = onto_merge::merge_ontologies({ { "http://example.org/food", "f" } }, repository);
    EXPECT_EQ(parents_of(result.graph, "f-Food"), (std::vector<std::string>{ "owl-Thing" }));
    EXPECT_EQ(result.closure.ontologies.size(), 1u);
}

TEST_F(ClassExtractorTest, MergeWithRootFilter) {
    onto_merge::MergeSettings settings;
    settings.exclude_owl_thing = true;
    auto result = onto_merge::merge_ontologies({ { "http://example.org/food", "f" } }, repository, settings);

    EXPECT_TRUE(parents_of(result.graph, "f-Food").empty());
    EXPECT_EQ(parents_of(result.graph, "f-Bread"), (std::vector<std::string>{ "f-Food" }));
}
