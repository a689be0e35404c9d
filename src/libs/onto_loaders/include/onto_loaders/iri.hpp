#pragma once

#include <string>

namespace onto_loaders {

// file:// URI for a local path, made absolute against the working directory.
// Bytes outside [A-Za-z0-9_.~/-] are percent-encoded.
std::string file_uri_from_path(const std::string& path);

// Inverse of file_uri_from_path. Returns an empty string for non-file IRIs.
std::string path_from_file_uri(const std::string& uri);

std::string percent_decode(const std::string& text);

bool has_scheme(const std::string& iri);
bool is_file_uri(const std::string& iri);

std::string strip_fragment(const std::string& iri);

// Resolves an IRI reference (rdf:about, rdf:resource, owl:imports, ...)
// against a base IRI.
std::string resolve_iri(const std::string& base, const std::string& reference);

// "http://a.org/x#Foo" -> "http://a.org/x#", "http://a.org/x/Foo" -> "http://a.org/x/".
std::string namespace_of(const std::string& iri);
std::string local_name_of(const std::string& iri);

// Last path segment of an IRI without a trailing '#' or '/'.
std::string last_segment(const std::string& iri);

} // namespace onto_loaders
