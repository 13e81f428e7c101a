#pragma once

#include <cairn/ml/provider.h>
#include <cairn/net/http_client.h>

#include <memory>
#include <mutex>

namespace cairn::ml {

/**
 * Remote embedding model.
 * - "ollama": POST {endpoint}/api/embeddings {model, prompt} -> {embedding: [...]}
 * - "openai": POST {endpoint}/embeddings {model, input} -> {data: [{embedding: [...]}]}
 * A response of the wrong width is InvalidData.
 */
class HttpEmbeddingProvider : public IEmbeddingProvider {
public:
    HttpEmbeddingProvider(EmbeddingProviderConfig config, std::shared_ptr<net::IHttpClient> http);

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override { return http_ != nullptr; }
    std::string getProviderName() const override { return config_.provider; }
    std::string getModelName() const override { return config_.model; }
    size_t getEmbeddingDimension() const override;

    Result<void> initialize() override;
    void shutdown() override {}

private:
    Result<std::vector<float>> parseEmbedding(const std::string& body) const;
    Result<void> checkDimension(size_t got);

    EmbeddingProviderConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
    mutable std::mutex dimMutex_;
};

/**
 * Remote completion model.
 * - "ollama": POST {endpoint}/api/generate {model, prompt, system, stream:false}
 * - "groq"/"openai": POST {endpoint}/chat/completions with system+user messages
 */
class HttpCompletionProvider : public ICompletionProvider {
public:
    HttpCompletionProvider(CompletionProviderConfig config,
                           std::shared_ptr<net::IHttpClient> http);

    Result<std::string> complete(const std::string& prompt,
                                 const std::string& systemPrompt) override;

    std::string getProviderName() const override { return config_.provider; }
    std::string getModelName() const override { return config_.model; }

private:
    bool isOllama() const { return config_.provider == "ollama"; }

    CompletionProviderConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
};

} // namespace cairn::ml
