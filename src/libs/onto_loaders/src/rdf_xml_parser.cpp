#include <onto_loaders/rdf_xml_parser.hpp>
#include <onto_loaders/iri.hpp>
#include <onto_model/errors.hpp>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>
#include <optional>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace onto_loaders {

namespace {

const std::string rdf_ns = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
const std::string rdfs_ns = "http://www.w3.org/2000/01/rdf-schema#";
const std::string xml_ns = "http://www.w3.org/XML/1998/namespace";
const std::string owl_ns = onto_model::owl_namespace;

const std::string rdf_RDF = rdf_ns + "RDF";
const std::string rdf_Description = rdf_ns + "Description";
const std::string rdf_type = rdf_ns + "type";
const std::string rdf_about = rdf_ns + "about";
const std::string rdf_ID = rdf_ns + "ID";
const std::string rdf_resource = rdf_ns + "resource";
const std::string rdf_nodeID = rdf_ns + "nodeID";
const std::string rdfs_subClassOf = rdfs_ns + "subClassOf";
const std::string owl_Ontology = owl_ns + "Ontology";
const std::string owl_imports = owl_ns + "imports";
const std::string owl_Class = owl_ns + "Class";
const std::string owl_Restriction = owl_ns + "Restriction";
const std::string xml_base = xml_ns + "base";

using Entities = std::unordered_map<std::string, std::string>;

struct Scope {
    std::unordered_map<std::string, std::string> prefixes; // "" is the default namespace
    std::string base;
};

// tinyxml2 does not understand a DOCTYPE internal subset, so it is cut out
// here and its <!ENTITY> declarations are kept for expansion.
std::string strip_doctype(const std::string& text, Entities& entities) {
    const auto start = text.find("<!DOCTYPE");
    if (start == std::string::npos) return text;

    const auto first_close = text.find('>', start);
    const auto subset_open = text.find('[', start);
    auto end = first_close;
    if (subset_open != std::string::npos && subset_open < first_close) {
        const auto subset_close = text.find(']', subset_open);
        if (subset_close == std::string::npos) return text;
        end = text.find('>', subset_close);

        static const std::regex entity_decl(
            R"re(<!ENTITY\s+([A-Za-z_][A-Za-z0-9_.-]*)\s+(?:"([^"]*)"|'([^']*)')\s*>)re");
        const auto first = text.begin() + static_cast<std::ptrdiff_t>(subset_open);
        const auto last = text.begin() + static_cast<std::ptrdiff_t>(subset_close);
        for (std::sregex_iterator it(first, last, entity_decl), stop; it != stop; ++it) {
            const auto& m = *it;
            entities[m[1].str()] = m[2].matched ? m[2].str() : m[3].str();
        }
    }
    if (end == std::string::npos) return text;
    return text.substr(0, start) + text.substr(end + 1);
}

std::string expand_entities(const std::string& text, const Entities& entities) {
    if (entities.empty()) return text;
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto amp = text.find('&', pos);
        if (amp == std::string::npos) break;
        out.append(text, pos, amp - pos);
        const auto semi = text.find(';', amp);
        if (semi != std::string::npos) {
            auto it = entities.find(text.substr(amp + 1, semi - amp - 1));
            if (it != entities.end()) {
                out += it->second;
                pos = semi + 1;
                continue;
            }
        }
        out += '&';
        pos = amp + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::string expand_name(const char* qname, const Scope& scope, bool is_attribute) {
    if (qname == nullptr) return {};
    const std::string name(qname);
    const auto colon = name.find(':');
    std::string prefix = colon == std::string::npos ? std::string() : name.substr(0, colon);
    const std::string local = colon == std::string::npos ? name : name.substr(colon + 1);
    if (prefix == "xml") return xml_ns + local;
    // unprefixed attributes are in no namespace
    if (prefix.empty() && is_attribute) return local;
    auto it = scope.prefixes.find(prefix);
    if (it == scope.prefixes.end()) return name;
    return it->second + local;
}

Scope enter(const tinyxml2::XMLElement* element, const Scope& outer) {
    Scope scope = outer;
    for (auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        const std::string name = attr->Name();
        if (name == "xmlns")
            scope.prefixes[""] = attr->Value();
        else if (name.compare(0, 6, "xmlns:") == 0)
            scope.prefixes[name.substr(6)] = attr->Value();
    }
    if (const char* base = element->Attribute("xml:base"))
        scope.base = resolve_iri(outer.base, base);
    return scope;
}

std::optional<std::string> attribute(const tinyxml2::XMLElement* element, const Scope& scope,
    const std::string& expanded)
{
    for (auto* attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next()) {
        if (expand_name(attr->Name(), scope, true) == expanded)
            return std::string(attr->Value());
    }
    return std::nullopt;
}

class DocumentParser {
public:
    explicit DocumentParser(const std::string& location) {
        out_.location = location;
    }

    onto_model::Ontology parse(const tinyxml2::XMLElement* root) {
        Scope top;
        top.base = out_.location;
        const Scope scope = enter(root, top);
        document_base_ = scope.base;

        if (expand_name(root->Name(), scope, false) == rdf_RDF) {
            for (auto* child = root->FirstChildElement(); child != nullptr; child = child->NextSiblingElement())
                node_element(child, scope);
        } else {
            node_element(root, top);
        }

        std::string base = !out_.ontology_iri.empty() ? out_.ontology_iri : strip_fragment(document_base_);
        if (base.empty() || (base.back() != '#' && base.back() != '/'))
            base += '#';
        out_.base_iri = base;
        out_.name = onto_model::canonical_name(out_.base_iri);
        return std::move(out_);
    }

private:
    std::string subject_of(const tinyxml2::XMLElement* element, const Scope& scope) const {
        if (auto about = attribute(element, scope, rdf_about))
            return resolve_iri(scope.base, *about);
        if (auto id = attribute(element, scope, rdf_ID))
            return strip_fragment(scope.base) + "#" + *id;
        return {};
    }

    void declare_class(const std::string& iri) {
        if (declared_.insert(iri).second)
            out_.classes.push_back(iri);
    }

    // Handles one node element and reports what it denotes when used as
    // the object of rdfs:subClassOf.
    onto_model::ClassExpression node_element(const tinyxml2::XMLElement* element, const Scope& outer) {
        using Kind = onto_model::ClassExpression::Kind;
        const Scope scope = enter(element, outer);
        const std::string type = expand_name(element->Name(), scope, false);
        const std::string subject = subject_of(element, scope);

        bool is_class = type == owl_Class;
        bool is_restriction = type == owl_Restriction;
        for (auto* prop = element->FirstChildElement(); prop != nullptr; prop = prop->NextSiblingElement()) {
            const Scope prop_scope = enter(prop, scope);
            if (expand_name(prop->Name(), prop_scope, false) != rdf_type) continue;
            if (auto resource = attribute(prop, prop_scope, rdf_resource)) {
                const std::string type_iri = resolve_iri(prop_scope.base, *resource);
                is_class = is_class || type_iri == owl_Class;
                is_restriction = is_restriction || type_iri == owl_Restriction;
            }
        }

        if (type == owl_Ontology) {
            out_.ontology_iri = subject.empty() ? strip_fragment(scope.base) : subject;
            for (auto* prop = element->FirstChildElement(); prop != nullptr; prop = prop->NextSiblingElement()) {
                const Scope prop_scope = enter(prop, scope);
                if (expand_name(prop->Name(), prop_scope, false) != owl_imports) continue;
                if (auto resource = attribute(prop, prop_scope, rdf_resource))
                    out_.imports.push_back(resolve_iri(prop_scope.base, *resource));
                else if (const char* text = prop->GetText())
                    out_.imports.push_back(resolve_iri(prop_scope.base, text));
            }
            return { Kind::Anonymous, {} };
        }

        if (is_class && !subject.empty())
            declare_class(subject);

        for (auto* prop = element->FirstChildElement(); prop != nullptr; prop = prop->NextSiblingElement()) {
            const Scope prop_scope = enter(prop, scope);
            const std::string predicate = expand_name(prop->Name(), prop_scope, false);
            if (predicate == rdfs_subClassOf && !subject.empty()) {
                if (auto object = property_value(prop, prop_scope))
                    out_.superclasses[subject].push_back(std::move(*object));
                continue;
            }
            // Nested node elements may still declare classes.
            for (auto* nested = prop->FirstChildElement(); nested != nullptr; nested = nested->NextSiblingElement())
                node_element(nested, prop_scope);
        }

        if (is_restriction) return { Kind::Restriction, {} };
        if (subject.empty()) return { Kind::Anonymous, {} };
        return { Kind::NamedClass, subject };
    }

    std::optional<onto_model::ClassExpression> property_value(const tinyxml2::XMLElement* prop, const Scope& scope) {
        if (auto resource = attribute(prop, scope, rdf_resource))
            return onto_model::ClassExpression{ onto_model::ClassExpression::Kind::NamedClass,
                resolve_iri(scope.base, *resource) };
        if (auto* nested = prop->FirstChildElement())
            return node_element(nested, scope);
        if (attribute(prop, scope, rdf_nodeID))
            return onto_model::ClassExpression{ onto_model::ClassExpression::Kind::Anonymous, {} };
        return std::nullopt;
    }

    onto_model::Ontology out_;
    std::string document_base_;
    std::unordered_set<std::string> declared_;
};

} // namespace

onto_model::Ontology parse_rdf_xml(const std::string& text, const std::string& location) {
    Entities entities;
    const std::string body = expand_entities(strip_doctype(text, entities), entities);

    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.c_str(), body.size()) != tinyxml2::XML_SUCCESS)
        throw onto_model::LoadError(location, std::string("malformed RDF/XML: ") + doc.ErrorStr());
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr)
        throw onto_model::LoadError(location, "document has no root element");

    onto_model::Ontology ontology = DocumentParser(location).parse(root);
    spdlog::debug("Parsed {}: {} classes, {} imports", location, ontology.classes.size(), ontology.imports.size());
    return ontology;
}

} // namespace onto_loaders
