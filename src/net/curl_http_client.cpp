#include <cairn/net/http_client.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <mutex>
#include <sstream>

namespace cairn::net {

namespace {

size_t writeCallback(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

private:
    CURL* curl_;
};

// Owns a curl_slist built from request headers
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list_)
            curl_slist_free_all(list_);
    }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::ProviderError;
            break;
    }
    return err;
}

std::once_flag gCurlInit;

} // namespace

CurlHttpClient::CurlHttpClient(std::string userAgent) : userAgent_(std::move(userAgent)) {
    std::call_once(gCurlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlHttpClient::post(const HttpRequest& request) {
    CurlHandle curl;
    if (!curl) {
        return Error{ErrorCode::NetworkError, "Failed to initialize cURL"};
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    HeaderList headers;
    headers.append("Content-Type: application/json");
    headers.append("Accept: application/json");
    for (const auto& [key, value] : request.headers) {
        headers.append(key + ": " + value);
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    spdlog::debug("POST {} ({} bytes)", request.url, request.body.size());
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return makeCurlError(res, "POST " + request.url);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("POST {} -> HTTP {}", request.url, response.status);
    return response;
}

Result<void> checkStatus(const HttpResponse& response, std::string_view where) {
    if (response.status < 400)
        return {};

    std::ostringstream msg;
    msg << where << ": HTTP error " << response.status;
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_discarded() && json.is_object()) {
        if (auto it = json.find("error"); it != json.end()) {
            if (it->is_string()) {
                msg << ": " << it->get<std::string>();
            } else if (it->is_object() && it->contains("message") &&
                       (*it)["message"].is_string()) {
                msg << ": " << (*it)["message"].get<std::string>();
            }
        }
    }
    return Error{ErrorCode::ProviderError, msg.str()};
}

std::shared_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_shared<CurlHttpClient>();
}

} // namespace cairn::net
