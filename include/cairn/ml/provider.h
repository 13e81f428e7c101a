#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cairn/core/types.h>

namespace cairn::net {
class IHttpClient;
}

namespace cairn::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * The knowledge base only sees fixed-width float vectors; which model or service
 * produced them is the provider's business.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @return Vector of getEmbeddingDimension() floats, or a provider failure
     *         (NetworkError/Timeout/ProviderError) or InvalidData for an unusable payload
     */
    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts, in input order
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;

    /**
     * Provider family, e.g. "hash", "ollama", "openai"
     */
    virtual std::string getProviderName() const = 0;

    /**
     * Model identifier recorded next to every stored embedding
     */
    virtual std::string getModelName() const = 0;

    virtual size_t getEmbeddingDimension() const = 0;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
};

// ============================================================================
// Abstract Completion Provider Interface
// ============================================================================

/**
 * Text-in/text-out language model. Used by the proposition extractor.
 */
class ICompletionProvider {
public:
    virtual ~ICompletionProvider() = default;

    virtual Result<std::string> complete(const std::string& prompt,
                                         const std::string& systemPrompt) = 0;

    virtual std::string getProviderName() const = 0;
    virtual std::string getModelName() const = 0;
};

// ============================================================================
// Factories
// ============================================================================

struct EmbeddingProviderConfig {
    std::string provider = "hash"; // hash | ollama | openai
    std::string endpoint = "http://localhost:11434";
    std::string model = "nomic-embed-text";
    std::string apiKey;
    size_t dimensions = 768; // 0: adopt whatever the first response returns
    std::chrono::milliseconds timeout{30'000};
};

struct CompletionProviderConfig {
    std::string provider = "groq"; // groq | openai | ollama
    std::string endpoint = "https://api.groq.com/openai/v1";
    std::string model = "llama-3.3-70b-versatile";
    std::string apiKey;
    int maxTokens = 1024;
    double temperature = 0.0;
    std::chrono::milliseconds timeout{60'000};
};

/**
 * Create an embedding provider for the configured family.
 * InvalidArgument for an unknown provider name.
 */
Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const EmbeddingProviderConfig& config,
                        std::shared_ptr<net::IHttpClient> http = nullptr);

Result<std::unique_ptr<ICompletionProvider>>
createCompletionProvider(const CompletionProviderConfig& config,
                         std::shared_ptr<net::IHttpClient> http = nullptr);

} // namespace cairn::ml
