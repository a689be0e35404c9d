#include <onto_export/types_writer.hpp>
#include <onto_model/errors.hpp>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>
#include <fstream>
#include <iostream>

namespace onto_export {

namespace {

const char generated_notice[] = " This file was generated automatically. Do not modify it manually. ";

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += separator;
        out += parts[i];
    }
    return out;
}

std::string ontologies_comment(const std::vector<onto_model::LoadedOntology>& ontologies) {
    std::vector<std::string> iris;
    for (const auto& loaded : ontologies)
        iris.push_back(loaded.ontology ? loaded.ontology->base_iri : std::string());
    return " Ontologies used:\n    " + join(iris, "\n    ") + "\n";
}

// Self-closing tags get a space before the slash: <type name="x" />
void space_empty_tags(std::string& text) {
    std::size_t pos = 0;
    while ((pos = text.find("\"/>", pos)) != std::string::npos) {
        text.replace(pos, 3, "\" />");
        pos += 4;
    }
}

} // namespace

std::string serialize_types(const onto_model::ClassGraph& graph,
    const std::vector<onto_model::LoadedOntology>& ontologies)
{
    tinyxml2::XMLDocument doc;
    doc.InsertEndChild(doc.NewDeclaration());
    doc.InsertEndChild(doc.NewComment(generated_notice));
    doc.InsertEndChild(doc.NewComment(ontologies_comment(ontologies).c_str()));

    tinyxml2::XMLElement* root = doc.NewElement("types");
    root->SetAttribute("name", types_set_name);
    root->SetAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");
    root->SetAttribute("xsi:noNamespaceSchemaLocation", types_schema_location);
    doc.InsertEndChild(root);

    for (const auto& entry : graph) {
        tinyxml2::XMLElement* type = doc.NewElement("type");
        type->SetAttribute("name", entry.name.c_str());
        if (!entry.parents.empty())
            type->SetAttribute("parents", join(entry.parents, " ").c_str());
        root->InsertEndChild(type);
    }

    // Default printer: 4-space indentation, one node per line.
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    std::string text = printer.CStr();
    space_empty_tags(text);
    return text;
}

void write_document(const std::string& text, const std::string& destination) {
    if (destination.empty() || destination == "-") {
        std::cout << text;
        std::cout.flush();
        if (!std::cout) throw onto_model::SerializationError("cannot write to standard output");
        return;
    }
    std::ofstream f(destination, std::ios::binary | std::ios::trunc);
    if (!f) throw onto_model::SerializationError("cannot open " + destination + " for writing");
    f << text;
    f.close();
    if (!f) throw onto_model::SerializationError("cannot write " + destination);
    spdlog::info("Wrote {} bytes to {}", text.size(), destination);
}

} // namespace onto_export
