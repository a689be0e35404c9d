#pragma once

#include <string>

namespace onto_loaders {

// Downloads ontology documents that are neither registered nor found in a
// lookup directory.
class DocumentFetcher {
public:
    virtual ~DocumentFetcher() = default;

    // Returns the document body. Throws onto_model::LoadError on failure.
    virtual std::string fetch(const std::string& url) = 0;
};

// libcurl-backed fetcher. Follows redirects and asks for RDF/XML.
class CurlFetcher : public DocumentFetcher {
public:
    CurlFetcher();
    ~CurlFetcher() override;

    CurlFetcher(const CurlFetcher&) = delete;
    CurlFetcher& operator=(const CurlFetcher&) = delete;

    std::string fetch(const std::string& url) override;

private:
    bool initialized_ = false;
};

} // namespace onto_loaders
