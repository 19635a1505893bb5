#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/budget_errors.hpp"

namespace budget::provider {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP GET. Implementations must be safe to call from several
// threads at once; YnabClient::batch fans out across std::async tasks.
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;

    virtual core::errors::Result<HttpResponse> get(
        const std::string& url, const std::vector<std::string>& headers) const = 0;
};

class CurlHttpFetcher : public HttpFetcher {
public:
    explicit CurlHttpFetcher(std::uint32_t timeout_ms = 15000);
    ~CurlHttpFetcher() override;

    CurlHttpFetcher(const CurlHttpFetcher&) = delete;
    CurlHttpFetcher& operator=(const CurlHttpFetcher&) = delete;

    core::errors::Result<HttpResponse> get(
        const std::string& url, const std::vector<std::string>& headers) const override;

private:
    std::uint32_t timeout_ms_;
};

}  // namespace budget::provider
