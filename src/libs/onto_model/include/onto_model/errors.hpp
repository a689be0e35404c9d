#pragma once

#include <stdexcept>
#include <string>

namespace onto_model {

// Malformed command line or project file.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An ontology location could not be resolved, read or parsed.
class LoadError : public std::runtime_error {
public:
    LoadError(const std::string& location, const std::string& message)
        : std::runtime_error(message + " (" + location + ")"), location_(location) {}

    const std::string& location() const { return location_; }

private:
    std::string location_;
};

// The output destination could not be written.
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace onto_model
