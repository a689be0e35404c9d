#include <onto_loaders/iri.hpp>
#include <cctype>
#include <filesystem>
#include <vector>

namespace onto_loaders {

namespace {

const char file_scheme[] = "file://";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '-' || c == '~' || c == '/';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "scheme://authority" prefix of an absolute IRI, or "scheme:" when there is no authority.
std::string scheme_and_authority(const std::string& iri) {
    const auto colon = iri.find(':');
    if (colon == std::string::npos) return {};
    if (iri.compare(colon + 1, 2, "//") != 0) return iri.substr(0, colon + 1);
    const auto path_start = iri.find('/', colon + 3);
    return path_start == std::string::npos ? iri : iri.substr(0, path_start);
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t pos = 0;
    for (;;) {
        const auto next = path.find('/', pos);
        segments.push_back(path.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (next == std::string::npos) break;
        pos = next + 1;
    }

    std::vector<std::string> out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        const bool last = i + 1 == segments.size();
        if (segment == "." || segment == "..") {
            // the leading empty segment of an absolute path is never popped
            if (segment == ".." && !out.empty() && !(out.size() == 1 && out[0].empty()))
                out.pop_back();
            if (last) out.emplace_back();
            continue;
        }
        out.push_back(segment);
    }

    std::string result;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i) result += '/';
        result += out[i];
    }
    return result;
}

} // namespace

std::string file_uri_from_path(const std::string& path) {
    const std::string absolute = std::filesystem::absolute(std::filesystem::path(path)).generic_string();
    std::string out = file_scheme;
    for (unsigned char c : absolute) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            static const char hex_digits[] = "0123456789ABCDEF";
            out += '%';
            out += hex_digits[c >> 4];
            out += hex_digits[c & 0x0F];
        }
    }
    return out;
}

std::string path_from_file_uri(const std::string& uri) {
    if (!is_file_uri(uri)) return {};
    std::string rest = strip_fragment(uri.substr(sizeof(file_scheme) - 1));
    // file://host/path: drop the host part, keep the absolute path
    if (!rest.empty() && rest[0] != '/') {
        const auto slash = rest.find('/');
        rest = slash == std::string::npos ? std::string() : rest.substr(slash);
    }
    return percent_decode(rest);
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

bool has_scheme(const std::string& iri) {
    if (iri.empty() || !std::isalpha(static_cast<unsigned char>(iri[0]))) return false;
    for (std::size_t i = 1; i < iri.size(); ++i) {
        const unsigned char c = iri[i];
        if (c == ':') return true;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
}

bool is_file_uri(const std::string& iri) {
    return iri.compare(0, sizeof(file_scheme) - 1, file_scheme) == 0;
}

std::string strip_fragment(const std::string& iri) {
    const auto hash = iri.find('#');
    return hash == std::string::npos ? iri : iri.substr(0, hash);
}

std::string resolve_iri(const std::string& base, const std::string& reference) {
    if (reference.empty()) return strip_fragment(base);
    if (has_scheme(reference)) return reference;
    if (reference[0] == '#') return strip_fragment(base) + reference;
    if (reference.compare(0, 2, "//") == 0) {
        const auto colon = base.find(':');
        return colon == std::string::npos ? reference : base.substr(0, colon + 1) + reference;
    }
    const std::string origin = scheme_and_authority(base);
    if (reference[0] == '/') return origin + remove_dot_segments(reference);

    std::string base_path = strip_fragment(base).substr(origin.size());
    const auto slash = base_path.rfind('/');
    base_path = slash == std::string::npos ? std::string("/") : base_path.substr(0, slash + 1);
    return origin + remove_dot_segments(base_path + reference);
}

std::string namespace_of(const std::string& iri) {
    auto split = iri.rfind('#');
    if (split == std::string::npos) split = iri.rfind('/');
    return split == std::string::npos ? std::string() : iri.substr(0, split + 1);
}

std::string local_name_of(const std::string& iri) {
    return iri.substr(namespace_of(iri).size());
}

std::string last_segment(const std::string& iri) {
    std::string trimmed = iri;
    while (!trimmed.empty() && (trimmed.back() == '#' || trimmed.back() == '/'))
        trimmed.pop_back();
    trimmed = strip_fragment(trimmed);
    const auto slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

} // namespace onto_loaders
