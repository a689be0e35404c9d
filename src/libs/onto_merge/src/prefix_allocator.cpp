#include <onto_merge/prefix_allocator.hpp>
#include <spdlog/spdlog.h>
#include <cctype>

namespace onto_merge {

namespace {

bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// The part after the last '/' and before the last '.'. Without a '.' the
// final character is dropped as well.
std::string short_name(const std::string& identifier) {
    const auto slash = identifier.rfind('/');
    const std::size_t begin = slash == std::string::npos ? 0 : slash + 1;
    const auto dot = identifier.rfind('.');
    const std::size_t end = dot != std::string::npos ? dot : (identifier.empty() ? 0 : identifier.size() - 1);
    if (end <= begin) return {};
    return identifier.substr(begin, end - begin);
}

std::string clean(const std::string& name) {
    std::string out;
    for (char c : name)
        if (is_ascii_letter(c) || c == '-' || c == '_') out += c;

    // one leading and one trailing hyphen
    if (!out.empty() && out.front() == '-') out.erase(0, 1);
    if (!out.empty() && out.back() == '-') out.pop_back();

    std::string collapsed;
    for (std::size_t i = 0; i < out.size(); ++i) {
        collapsed += out[i];
        if (out[i] == '-' && i + 1 < out.size() && out[i + 1] == '-') ++i;
    }
    return collapsed;
}

std::string initials(const std::string& name, char separator) {
    std::string out;
    std::size_t begin = 0;
    while (begin <= name.size()) {
        auto end = name.find(separator, begin);
        if (end == std::string::npos) end = name.size();
        if (end > begin) out += lower(name[begin]);
        begin = end + 1;
    }
    return out;
}

} // namespace

std::string PrefixRegistry::allocate(const std::string& candidate) {
    std::string prefix = candidate;
    for (unsigned counter = 0; used_.count(prefix); ++counter)
        prefix = candidate + std::to_string(counter);
    used_.insert(prefix);
    allocated_.push_back(prefix);
    spdlog::debug("Allocated prefix '{}' (requested '{}')", prefix, candidate);
    return prefix;
}

std::string PrefixRegistry::derive(const std::string& identifier) {
    return allocate(derive_prefix_candidate(identifier));
}

std::string derive_prefix_candidate(const std::string& identifier) {
    const std::string name = clean(short_name(identifier));

    if (name.find('-') != std::string::npos) return initials(name, '-');
    if (name.find('_') != std::string::npos) return initials(name, '_');

    std::string uppercase;
    for (char c : name)
        if (c >= 'A' && c <= 'Z') uppercase += c;
    if (uppercase.size() <= 3) {
        for (char& c : uppercase) c = lower(c);
        return uppercase;
    }

    std::string out = name.substr(0, 3);
    for (char& c : out) c = lower(c);
    return out;
}

} // namespace onto_merge
