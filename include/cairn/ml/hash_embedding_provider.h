#pragma once

#include <cairn/ml/provider.h>

namespace cairn::ml {

/**
 * Deterministic offline embedding provider.
 * Seeds a normal distribution with a hash of the text and returns the unit-length draw,
 * so identical texts embed identically and different texts are close to orthogonal.
 */
class HashEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashEmbeddingProvider(size_t dimension = 768);
    ~HashEmbeddingProvider() override;

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "hash"; }
    std::string getModelName() const override;
    size_t getEmbeddingDimension() const override { return dimension_; }

    Result<void> initialize() override;
    void shutdown() override;

private:
    size_t dimension_;
    bool initialized_ = false;
};

} // namespace cairn::ml
