#pragma once

#include <cairn/extraction/extraction_provider.h>
#include <cairn/ml/provider.h>

#include <unistd.h>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace cairn::test {

inline std::filesystem::path tempDbPath(const char* prefix) {
    const char* t = std::getenv("CAIRN_TEST_TMPDIR");
    auto base = (t && *t) ? std::filesystem::path(t) : std::filesystem::temp_directory_path();
    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    auto p = base / (std::string(prefix) + std::to_string(ts) + ".db");
    std::filesystem::remove(p, ec);
    return p;
}

// Removes the database and its WAL side files
inline void removeDb(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
    std::filesystem::remove(p.string() + "-wal", ec);
    std::filesystem::remove(p.string() + "-shm", ec);
}

inline std::filesystem::path makeTempDir(const std::string& prefix = "cairn_test_") {
    auto base = std::filesystem::temp_directory_path();
    auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(ts) + "_" +
                         std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path writeFile(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

// ---------------------------------------------------------------------------
// Vectors with known cosine similarity
// ---------------------------------------------------------------------------

constexpr std::size_t kTestDim = 16;

inline std::vector<float> basis(std::size_t i, std::size_t dim = kTestDim) {
    std::vector<float> v(dim, 0.0f);
    v[i % dim] = 1.0f;
    return v;
}

// Unit vector whose cosine with basis(a) is `cosine`, rotated toward basis(b)
inline std::vector<float> atCosine(double cosine, std::size_t a = 0, std::size_t b = 1,
                                   std::size_t dim = kTestDim) {
    std::vector<float> v(dim, 0.0f);
    v[a] = static_cast<float>(cosine);
    v[b] = static_cast<float>(std::sqrt(1.0 - cosine * cosine));
    return v;
}

inline extraction::Proposition makeProposition(
    std::string text, metadata::NodePurpose purpose = metadata::NodePurpose::Observation,
    double confidence = 0.9) {
    extraction::Proposition p;
    p.text = std::move(text);
    p.purpose = purpose;
    p.confidence = confidence;
    return p;
}

// ---------------------------------------------------------------------------
// Stub collaborators
// ---------------------------------------------------------------------------

/**
 * Returns the propositions registered for a message text; ProviderError for texts in
 * `failing`, no propositions for anything else.
 */
class StubExtractionProvider : public extraction::IExtractionProvider {
public:
    std::map<std::string, std::vector<extraction::Proposition>> responses;
    std::set<std::string> failing;
    std::vector<std::string> calls;

    Result<std::vector<extraction::Proposition>> extract(const std::string& text) override {
        calls.push_back(text);
        if (failing.count(text))
            return Error{ErrorCode::ProviderError, "stub extraction failure"};
        auto it = responses.find(text);
        if (it == responses.end())
            return std::vector<extraction::Proposition>{};
        return it->second;
    }
};

/**
 * Embeds registered texts to fixed vectors. Unregistered texts get a fresh basis vector
 * from the upper half of the space, so they are orthogonal to everything else.
 */
class MapEmbeddingProvider : public ml::IEmbeddingProvider {
public:
    explicit MapEmbeddingProvider(std::size_t dim = kTestDim) : dim_(dim), next_(dim / 2) {}

    std::map<std::string, std::vector<float>> vectors;
    std::set<std::string> failing;

    Result<std::vector<float>> generateEmbedding(const std::string& text) override {
        if (failing.count(text))
            return Error{ErrorCode::Timeout, "stub embedding timeout"};
        auto it = vectors.find(text);
        if (it != vectors.end())
            return it->second;
        auto v = basis(next_, dim_);
        next_ = next_ + 1 < dim_ ? next_ + 1 : dim_ / 2;
        vectors.emplace(text, v);
        return v;
    }

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        std::vector<std::vector<float>> out;
        for (const auto& t : texts) {
            auto v = generateEmbedding(t);
            if (!v)
                return v.error();
            out.push_back(std::move(v).value());
        }
        return out;
    }

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "map"; }
    std::string getModelName() const override { return "map-test"; }
    size_t getEmbeddingDimension() const override { return dim_; }
    Result<void> initialize() override { return {}; }
    void shutdown() override {}

private:
    std::size_t dim_;
    std::size_t next_;
};

} // namespace cairn::test
