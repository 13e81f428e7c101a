#include <spdlog/spdlog.h>
#include <cairn/ml/hash_embedding_provider.h>

#include <cmath>
#include <cstdint>
#include <random>

namespace cairn::ml {

namespace {

// FNV-1a; std::hash is not stable across standard libraries
std::uint64_t fnv1a(const std::string& text) {
    std::uint64_t h = 14695981039346656037ull;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace

HashEmbeddingProvider::HashEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    spdlog::debug("HashEmbeddingProvider created with dimension {}", dimension);
}

HashEmbeddingProvider::~HashEmbeddingProvider() {
    if (initialized_) {
        shutdown();
    }
}

Result<void> HashEmbeddingProvider::initialize() {
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidArgument, "Hash embedding dimension must be positive"};
    }
    initialized_ = true;
    return Result<void>();
}

void HashEmbeddingProvider::shutdown() {
    initialized_ = false;
}

std::string HashEmbeddingProvider::getModelName() const {
    return "hash-" + std::to_string(dimension_);
}

Result<std::vector<float>> HashEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Hash provider not initialized"};
    }

    std::mt19937_64 gen(fnv1a(text));
    std::normal_distribution<double> dist(0.0, 1.0);

    std::vector<double> raw(dimension_);
    double norm = 0.0;
    for (size_t i = 0; i < dimension_; ++i) {
        raw[i] = dist(gen);
        norm += raw[i] * raw[i];
    }
    norm = std::sqrt(norm);

    std::vector<float> embedding(dimension_);
    for (size_t i = 0; i < dimension_; ++i) {
        embedding[i] = norm > 0.0 ? static_cast<float>(raw[i] / norm) : 0.0f;
    }
    return embedding;
}

Result<std::vector<std::vector<float>>>
HashEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    for (const auto& text : texts) {
        auto result = generateEmbedding(text);
        if (!result) {
            return result.error();
        }
        embeddings.push_back(std::move(result).value());
    }
    return embeddings;
}

} // namespace cairn::ml
