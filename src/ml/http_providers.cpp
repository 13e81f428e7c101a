#include <cairn/ml/hash_embedding_provider.h>
#include <cairn/ml/http_providers.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cairn::ml {

namespace {

std::string joinUrl(std::string base, std::string_view path) {
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + std::string(path);
}

std::string snippet(const std::string& body) {
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

} // namespace

// ---------------------------------------------------------------------------
// HttpEmbeddingProvider
// ---------------------------------------------------------------------------

HttpEmbeddingProvider::HttpEmbeddingProvider(EmbeddingProviderConfig config,
                                             std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

Result<void> HttpEmbeddingProvider::initialize() {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "Embedding provider has no HTTP client"};
    }
    if (config_.model.empty()) {
        return Error{ErrorCode::InvalidArgument, "Embedding model name is empty"};
    }
    return {};
}

size_t HttpEmbeddingProvider::getEmbeddingDimension() const {
    std::lock_guard<std::mutex> lock(dimMutex_);
    return config_.dimensions;
}

Result<void> HttpEmbeddingProvider::checkDimension(size_t got) {
    std::lock_guard<std::mutex> lock(dimMutex_);
    if (config_.dimensions == 0) {
        config_.dimensions = got;
        spdlog::debug("Embedding model {} reports dimension {}", config_.model, got);
        return {};
    }
    if (got != config_.dimensions) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Embedding model {} returned {} dimensions, expected {}",
                                 config_.model, got, config_.dimensions)};
    }
    return {};
}

Result<std::vector<float>> HttpEmbeddingProvider::parseEmbedding(const std::string& body) const {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Error{ErrorCode::InvalidData, "Embedding response is not JSON: " + snippet(body)};
    }

    const nlohmann::json* vec = nullptr;
    if (auto it = json.find("embedding"); it != json.end()) {
        vec = &*it;
    } else if (auto data = json.find("data");
               data != json.end() && data->is_array() && !data->empty() &&
               (*data)[0].is_object() && (*data)[0].contains("embedding")) {
        vec = &(*data)[0]["embedding"];
    } else if (auto embs = json.find("embeddings");
               embs != json.end() && embs->is_array() && !embs->empty()) {
        vec = &(*embs)[0];
    }
    if (!vec || !vec->is_array() || vec->empty()) {
        return Error{ErrorCode::InvalidData, "Embedding response has no vector: " + snippet(body)};
    }

    std::vector<float> out;
    out.reserve(vec->size());
    for (const auto& v : *vec) {
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "Embedding vector contains a non-number"};
        }
        out.push_back(v.get<float>());
    }
    return out;
}

Result<std::vector<float>> HttpEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "Embedding provider has no HTTP client"};
    }

    net::HttpRequest req;
    req.timeout = config_.timeout;
    nlohmann::json payload;
    if (config_.provider == "ollama") {
        req.url = joinUrl(config_.endpoint, "/api/embeddings");
        payload["model"] = config_.model;
        payload["prompt"] = text;
    } else {
        req.url = joinUrl(config_.endpoint, "/embeddings");
        payload["model"] = config_.model;
        payload["input"] = text;
        if (!config_.apiKey.empty())
            req.headers["Authorization"] = "Bearer " + config_.apiKey;
    }
    req.body = payload.dump();

    auto resp = http_->post(req);
    if (!resp)
        return resp.error();
    auto status = net::checkStatus(resp.value(), "embedding request");
    if (!status)
        return status.error();

    auto vec = parseEmbedding(resp.value().body);
    if (!vec)
        return vec.error();
    auto dim = checkDimension(vec.value().size());
    if (!dim)
        return dim.error();
    return vec;
}

Result<std::vector<std::vector<float>>>
HttpEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        auto result = generateEmbedding(text);
        if (!result)
            return result.error();
        embeddings.push_back(std::move(result).value());
    }
    return embeddings;
}

// ---------------------------------------------------------------------------
// HttpCompletionProvider
// ---------------------------------------------------------------------------

HttpCompletionProvider::HttpCompletionProvider(CompletionProviderConfig config,
                                               std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

Result<std::string> HttpCompletionProvider::complete(const std::string& prompt,
                                                     const std::string& systemPrompt) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "Completion provider has no HTTP client"};
    }

    net::HttpRequest req;
    req.timeout = config_.timeout;
    nlohmann::json payload;
    payload["model"] = config_.model;

    if (isOllama()) {
        req.url = joinUrl(config_.endpoint, "/api/generate");
        payload["prompt"] = prompt;
        payload["system"] = systemPrompt;
        payload["stream"] = false;
        payload["format"] = "json";
        payload["options"] = {{"temperature", config_.temperature}};
    } else {
        req.url = joinUrl(config_.endpoint, "/chat/completions");
        payload["messages"] = nlohmann::json::array(
            {{{"role", "system"}, {"content", systemPrompt}}, {{"role", "user"}, {"content", prompt}}});
        payload["max_tokens"] = config_.maxTokens;
        payload["temperature"] = config_.temperature;
        payload["response_format"] = {{"type", "json_object"}};
        if (config_.apiKey.empty()) {
            spdlog::warn("No API key configured for {} completion provider", config_.provider);
        } else {
            req.headers["Authorization"] = "Bearer " + config_.apiKey;
        }
    }
    req.body = payload.dump();

    auto resp = http_->post(req);
    if (!resp)
        return resp.error();
    auto status = net::checkStatus(resp.value(), "completion request");
    if (!status)
        return status.error();

    const auto& body = resp.value().body;
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Error{ErrorCode::InvalidData, "Completion response is not JSON: " + snippet(body)};
    }

    if (isOllama()) {
        auto it = json.find("response");
        if (it == json.end() || !it->is_string()) {
            return Error{ErrorCode::InvalidData,
                         "Completion response has no 'response' text: " + snippet(body)};
        }
        return it->get<std::string>();
    }

    auto choices = json.find("choices");
    if (choices == json.end() || !choices->is_array() || choices->empty()) {
        return Error{ErrorCode::InvalidData, "Completion response has no choices: " + snippet(body)};
    }
    const auto& choice = (*choices)[0];
    auto message = choice.is_object() ? choice.find("message") : choice.end();
    if (message == choice.end() || !message->is_object()) {
        return Error{ErrorCode::InvalidData,
                     "Completion choice has no message: " + snippet(body)};
    }
    auto content = message->find("content");
    if (content == message->end() || !content->is_string()) {
        return Error{ErrorCode::InvalidData,
                     "Completion choice has no message content: " + snippet(body)};
    }
    return content->get<std::string>();
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const EmbeddingProviderConfig& config,
                        std::shared_ptr<net::IHttpClient> http) {
    std::unique_ptr<IEmbeddingProvider> provider;
    if (config.provider == "hash" || config.provider == "mock") {
        provider = std::make_unique<HashEmbeddingProvider>(config.dimensions);
    } else if (config.provider == "ollama" || config.provider == "openai") {
        if (!http)
            http = net::makeCurlHttpClient();
        provider = std::make_unique<HttpEmbeddingProvider>(config, std::move(http));
    } else {
        return Error{ErrorCode::InvalidArgument,
                     "Unknown embedding provider '" + config.provider + "'"};
    }

    auto init = provider->initialize();
    if (!init)
        return init.error();
    spdlog::debug("Embedding provider {} ({}) ready", provider->getProviderName(),
                  provider->getModelName());
    return provider;
}

Result<std::unique_ptr<ICompletionProvider>>
createCompletionProvider(const CompletionProviderConfig& config,
                         std::shared_ptr<net::IHttpClient> http) {
    if (config.provider != "groq" && config.provider != "openai" && config.provider != "ollama") {
        return Error{ErrorCode::InvalidArgument,
                     "Unknown completion provider '" + config.provider + "'"};
    }
    if (!http)
        http = net::makeCurlHttpClient();
    return std::unique_ptr<ICompletionProvider>(
        std::make_unique<HttpCompletionProvider>(config, std::move(http)));
}

} // namespace cairn::ml
