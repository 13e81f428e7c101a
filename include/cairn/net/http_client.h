#pragma once

#include <cairn/core/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace cairn::net {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30'000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * Minimal blocking HTTP client used by the model providers.
 *
 * Transport failures come back as errors: Timeout when the deadline passed,
 * NetworkError when the peer could not be reached. Any HTTP status is a successful
 * response; use checkStatus() to turn error statuses into ProviderError.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> post(const HttpRequest& request) = 0;
};

/**
 * libcurl easy-API implementation. One handle per request; safe to share.
 */
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(std::string userAgent = "cairn/0.1");

    Result<HttpResponse> post(const HttpRequest& request) override;

private:
    std::string userAgent_;
};

// ProviderError for status >= 400, carrying the status and any "error" message in the body
Result<void> checkStatus(const HttpResponse& response, std::string_view where);

std::shared_ptr<IHttpClient> makeCurlHttpClient();

} // namespace cairn::net
