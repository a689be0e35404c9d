#include <onto_loaders/document_fetcher.hpp>
#include <onto_model/errors.hpp>
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>

namespace onto_loaders {

namespace {

const long download_timeout_seconds = 60;

std::size_t append_body(char* data, std::size_t size, std::size_t count, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * count);
    return size * count;
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlFetcher::CurlFetcher() {
    initialized_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    if (!initialized_)
        spdlog::warn("libcurl initialization failed, remote ontologies cannot be downloaded");
}

CurlFetcher::~CurlFetcher() {
    if (initialized_) curl_global_cleanup();
}

std::string CurlFetcher::fetch(const std::string& url) {
    if (!initialized_)
        throw onto_model::LoadError(url, "cannot download, libcurl is not initialized");

    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle)
        throw onto_model::LoadError(url, "cannot download, curl_easy_init failed");

    std::unique_ptr<curl_slist, HeaderListDeleter> headers(
        curl_slist_append(nullptr, "Accept: application/rdf+xml, application/xml;q=0.9, */*;q=0.1"));

    std::string body;
    char error[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, download_timeout_seconds);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "owl2types");
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

    spdlog::debug("Downloading {}", url);
    const CURLcode result = curl_easy_perform(handle.get());
    if (result != CURLE_OK) {
        const std::string reason = error[0] != '\0' ? error : curl_easy_strerror(result);
        throw onto_model::LoadError(url, "download failed: " + reason);
    }
    spdlog::info("Downloaded {} bytes from {}", body.size(), url);
    return body;
}

} // namespace onto_loaders
