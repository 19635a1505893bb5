#include <curl/curl.h>

#include "core/logging/logger.hpp"
#include "provider/http_fetcher.hpp"

namespace budget::provider {

using core::errors::BudgetError;
using core::errors::ErrorCategory;

namespace {

// CURL write callback for collecting response data into a string.
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

}  // namespace

CurlHttpFetcher::CurlHttpFetcher(const std::uint32_t timeout_ms) : timeout_ms_(timeout_ms) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpFetcher::~CurlHttpFetcher() {
    curl_global_cleanup();
}

core::errors::Result<HttpResponse> CurlHttpFetcher::get(
    const std::string& url, const std::vector<std::string>& headers) const {
    LOG_DEBUG("CurlHttpFetcher: GET " + url);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return BudgetError{ErrorCategory::Provider, "Failed to initialize CURL",
                           "curl_init_failed"};
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }
    header_list = curl_slist_append(header_list, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required for multi-threaded use

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return BudgetError{ErrorCategory::Provider,
                           std::string("HTTP GET failed: ") + curl_easy_strerror(res),
                           "http_transport_failed",
                           "Check network connectivity and YNAB_BASE_URL."};
    }

    LOG_DEBUG("CurlHttpFetcher: HTTP " + std::to_string(response.status) + " for " + url);
    return response;
}

}  // namespace budget::provider
